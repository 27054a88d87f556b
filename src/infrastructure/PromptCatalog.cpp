#include "infrastructure/PromptCatalog.hpp"

namespace ideasnapshot::infrastructure {

std::string PromptCatalog::GetSnapshotPrompt(const std::string& inputJson, int maxWords) {
    const std::string words = std::to_string(maxWords);
    return
        "# Feasibility Snapshot Generation\n\n"
        "## Input Data\n"
        "```json\n" + inputJson + "\n```\n\n"
        "## Task\n"
        "Generate a 1-page feasibility snapshot following this structure:\n\n"
        "1. **Viability Score (0-100)**: Assess based on demand signals, competition, and execution complexity\n"
        "2. **Lean Plan Tiles**: Extract problem, solution, audience, channels, differentiators, risks, assumptions\n"
        "3. **Top 3 Competitors**: Name and positioning angle with evidence references\n"
        "4. **Price Band**: Realistic pricing range based on evidence\n"
        "5. **Next 5 Steps**: Actionable steps tailored to user profile\n\n"
        "## Requirements\n"
        "- Use ONLY provided evidence\n"
        "- Stay under " + words + " words\n"
        "- Include inline citations as [[ref_XXX - YYYY-MM-DD]]\n"
        "- Be concise and actionable\n"
        "- If evidence is thin, mark as \"Assumption\"\n\n"
        "## Output Format\n"
        "Return ONE JSON object and nothing else, with these keys:\n"
        "{\n"
        "  \"idea_name\": string,\n"
        "  \"viability_score\": integer 0-100,\n"
        "  \"score_rationale\": string,\n"
        "  \"lean_tiles\": {\"problem\": string, \"solution\": string, \"audience\": string,\n"
        "                 \"channels\": [string], \"differentiators\": [string],\n"
        "                 \"risks\": [string], \"assumptions\": [string]},\n"
        "  \"competitors\": [{\"name\": string, \"angle\": string, \"evidence_refs\": [string], \"dates\": [string]}],\n"
        "  \"price_band\": {\"min\": number|null, \"max\": number|null, \"currency\": \"USD\", \"is_assumption\": bool},\n"
        "  \"next_steps\": [string]\n"
        "}\n";
}

} // namespace ideasnapshot::infrastructure
