#pragma once

#include <string_view>

namespace cropsight::detection {

/// Instruction sent with the image to every external vision model.
inline constexpr std::string_view kVisionPrompt =
    "You are an expert plant pathologist and agricultural entomologist. Identify the crop "
    "disease or pest in this image. Respond with ONLY a JSON object in this exact format:\n"
    "{\n"
    "  \"disease_name\": \"Common name of the disease or pest\",\n"
    "  \"confidence\": 0.95,\n"
    "  \"risk_level\": \"low|medium|high|critical\",\n"
    "  \"plant\": \"Affected plant\",\n"
    "  \"symptoms\": [\"visible symptom 1\", \"visible symptom 2\"]\n"
    "}\n"
    "If the plant looks healthy, use \"Healthy\" as disease_name and \"low\" as risk_level.";

}  // namespace cropsight::detection
