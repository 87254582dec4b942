#include "repeathd/capsule.hpp"

#include "repeathd/constants.hpp"

namespace repeathd::capsule {

namespace {

std::string EscapeJson(std::string_view input) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(input.size());
    for (char ch : input) {
        unsigned char byte = static_cast<unsigned char>(ch);
        switch (ch) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (byte < 0x20) {
                    out += "\\u00";
                    out.push_back(kHex[(byte >> 4) & 0x0F]);
                    out.push_back(kHex[byte & 0x0F]);
                } else {
                    out.push_back(ch);
                }
        }
    }
    return out;
}

void AppendField(std::string& json, std::string_view key, std::string_view value) {
    json.push_back('"');
    json += EscapeJson(key);
    json += "\": \"";
    json += EscapeJson(value);
    json.push_back('"');
}

void AppendArray(std::string& json, std::string_view key, const std::vector<std::string>& values) {
    json.push_back('"');
    json += EscapeJson(key);
    json += "\": [";
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            json += ", ";
        }
        json.push_back('"');
        json += EscapeJson(values[i]);
        json.push_back('"');
    }
    json.push_back(']');
}

}  // namespace

Capsule Build(std::string_view normalized_frame_hex, const outcome::Outcome& result) {
    Capsule capsule;
    capsule.encoding = std::string(constants::kCapsuleEncoding);
    if (result.status != outcome::Status::Error) {
        capsule.normalized_frame_hex = std::string(normalized_frame_hex);
    }
    if (result.status != outcome::Status::Pass) {
        capsule.errors = result.reasons;
    }
    return capsule;
}

std::string ToJson(const Capsule& capsule, bool include_errors) {
    std::string json;
    json.reserve(64 + capsule.normalized_frame_hex.size());
    json.push_back('{');
    AppendField(json, "encoding", capsule.encoding);
    json += ", ";
    AppendField(json, "normalized_frame_hex", capsule.normalized_frame_hex);
    if (include_errors && !capsule.errors.empty()) {
        json += ", ";
        AppendArray(json, "errors", capsule.errors);
    }
    json.push_back('}');
    return json;
}

std::string ErrorsJson(const std::vector<std::string>& errors) {
    std::string json;
    json.push_back('{');
    AppendArray(json, "errors", errors);
    json.push_back('}');
    return json;
}

Rendered Render(std::string_view normalized_frame_hex, const outcome::Outcome& result) {
    Capsule capsule = Build(normalized_frame_hex, result);
    Rendered rendered;
    rendered.exit_code = outcome::ExitCode(result.status);
    switch (result.status) {
        case outcome::Status::Pass:
            rendered.stdout_text = ToJson(capsule, false);
            break;
        case outcome::Status::Fail:
            rendered.stdout_text = ToJson(capsule, false);
            rendered.stderr_text = ErrorsJson(capsule.errors);
            break;
        case outcome::Status::Error:
            rendered.stdout_text = ToJson(capsule, true);
            break;
    }
    return rendered;
}

}  // namespace repeathd::capsule
