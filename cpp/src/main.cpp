#include "repeathd/repeathd.hpp"

#include "repeathd/cli_colors.hpp"
#include "repeathd/env.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

void PrintUsage(std::ostream& os) {
    os << "Usage: repeathd [--no-color] [--verbose] <command> ...\n";
    os << "  repeathd encode [<text> | --file <path>] [--out <path>]\n";
    os << "  repeathd verify [--file <path> | --hex <text> | --stdin-hex] [--strict]\n";
    os << "  repeathd publichex-verify [--hex <text>]\n";
    os << "  repeathd tag <text>\n";
    os << "  repeathd tag-verify [<tagged>]\n";
    os << "  repeathd version\n";
    os << "Global flags go before the command.\n";
    os << "Input defaults to stdin. Exit codes: 0 PASS, 2 FAIL, 1 ERROR.\n";
}

class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

struct GlobalFlags {
    bool verbose = repeathd::env::Load().verbose;
    bool no_color = false;
};

struct EncodeArgs {
    std::string text;
    bool has_text = false;
    std::string file;
    std::string out;
};

struct VerifyArgs {
    std::string file;
    std::string hex;
    bool has_hex = false;
    bool stdin_hex = false;
    bool strict = repeathd::env::Load().strict;
};

struct HexArgs {
    std::string hex;
    bool has_hex = false;
};

std::string RequireValue(const std::vector<std::string>& args, std::size_t& idx, const std::string& flag) {
    if (idx + 1 >= args.size()) {
        throw UsageError("Missing value for " + flag);
    }
    idx += 2;
    return args[idx - 1];
}

// Global flags are only recognized ahead of the command word; anything after
// it belongs to the command and is parsed there.
std::vector<std::string> ExtractGlobalFlags(int argc, char** argv, GlobalFlags& flags) {
    std::vector<std::string> rest;
    int i = 1;
    for (; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--verbose" || arg == "-v") {
            flags.verbose = true;
        } else if (arg == "--no-color") {
            flags.no_color = true;
        } else {
            break;
        }
    }
    for (; i < argc; ++i) {
        rest.emplace_back(argv[i]);
    }
    return rest;
}

EncodeArgs ParseEncodeArgs(const std::vector<std::string>& args) {
    EncodeArgs opts;
    std::size_t idx = 1;
    while (idx < args.size()) {
        const std::string& flag = args[idx];
        if (flag == "--file" || flag == "-f") {
            opts.file = RequireValue(args, idx, flag);
        } else if (flag == "--out" || flag == "-o") {
            opts.out = RequireValue(args, idx, flag);
        } else if (!flag.empty() && flag[0] == '-') {
            throw UsageError("Unknown flag: " + flag);
        } else if (!opts.has_text) {
            opts.text = flag;
            opts.has_text = true;
            idx += 1;
        } else {
            throw UsageError("Unexpected argument: " + flag);
        }
    }
    if (opts.has_text && !opts.file.empty()) {
        throw UsageError("Give either <text> or --file, not both");
    }
    return opts;
}

VerifyArgs ParseVerifyArgs(const std::vector<std::string>& args) {
    VerifyArgs opts;
    std::size_t idx = 1;
    while (idx < args.size()) {
        const std::string& flag = args[idx];
        if (flag == "--file" || flag == "-f") {
            opts.file = RequireValue(args, idx, flag);
        } else if (flag == "--hex") {
            opts.hex = RequireValue(args, idx, flag);
            opts.has_hex = true;
        } else if (flag == "--stdin-hex") {
            opts.stdin_hex = true;
            idx += 1;
        } else if (flag == "--strict") {
            opts.strict = true;
            idx += 1;
        } else if (flag == "--no-strict") {
            opts.strict = false;
            idx += 1;
        } else {
            throw UsageError("Unknown flag: " + flag);
        }
    }
    int sources = (opts.file.empty() ? 0 : 1) + (opts.has_hex ? 1 : 0) + (opts.stdin_hex ? 1 : 0);
    if (sources > 1) {
        throw UsageError("Choose one input: --file, --hex or --stdin-hex");
    }
    return opts;
}

HexArgs ParseHexArgs(const std::vector<std::string>& args) {
    HexArgs opts;
    std::size_t idx = 1;
    while (idx < args.size()) {
        const std::string& flag = args[idx];
        if (flag == "--hex") {
            opts.hex = RequireValue(args, idx, flag);
            opts.has_hex = true;
        } else {
            throw UsageError("Unknown flag: " + flag);
        }
    }
    return opts;
}

std::string ReadStdinText() {
    std::vector<std::uint8_t> data = repeathd::ReadStream(std::cin);
    return std::string(data.begin(), data.end());
}

std::string StripTrailingNewlines(std::string value) {
    while (!value.empty() && (value.back() == '\n' || value.back() == '\r')) {
        value.pop_back();
    }
    return value;
}

int Emit(const repeathd::Verification& verification, const GlobalFlags& flags, const std::string& label) {
    repeathd::capsule::Rendered rendered = repeathd::Render(verification);
    std::cout << rendered.stdout_text << "\n";
    if (!rendered.stderr_text.empty()) {
        std::cerr << rendered.stderr_text << "\n";
    }
    if (flags.verbose) {
        repeathd::cli::Status(verification.result.status, label);
    }
    return rendered.exit_code;
}

int RunEncode(const std::vector<std::string>& args, const GlobalFlags& flags) {
    EncodeArgs opts = ParseEncodeArgs(args);
    std::vector<std::uint8_t> payload;
    if (opts.has_text) {
        payload.assign(opts.text.begin(), opts.text.end());
    } else if (!opts.file.empty()) {
        payload = repeathd::ReadFile(opts.file);
    } else {
        payload = repeathd::ReadStream(std::cin);
    }
    if (!opts.out.empty()) {
        repeathd::WriteFile(opts.out, repeathd::frame::Encode(payload));
    }
    return Emit(repeathd::EncodeFrame(payload), flags, "encode");
}

int RunVerify(const std::vector<std::string>& args, const GlobalFlags& flags) {
    VerifyArgs opts = ParseVerifyArgs(args);
    repeathd::VerifyOptions verify_opts;
    verify_opts.strict = opts.strict;
    std::string label = opts.strict ? "verify (strict)" : "verify";
    if (opts.has_hex) {
        return Emit(repeathd::VerifyFrameHex(opts.hex, verify_opts), flags, label);
    }
    if (opts.stdin_hex) {
        return Emit(repeathd::VerifyFrameHex(ReadStdinText(), verify_opts), flags, label);
    }
    std::vector<std::uint8_t> wire = opts.file.empty() ? repeathd::ReadStream(std::cin)
                                                       : repeathd::ReadFile(opts.file);
    return Emit(repeathd::VerifyFrameBytes(wire, verify_opts), flags, label);
}

int RunPublicHexVerify(const std::vector<std::string>& args, const GlobalFlags& flags) {
    HexArgs opts = ParseHexArgs(args);
    std::string raw = opts.has_hex ? opts.hex : ReadStdinText();
    return Emit(repeathd::VerifyPublicHex(raw), flags, "publichex-verify");
}

int RunTag(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        throw UsageError("tag expects exactly one <text> argument");
    }
    std::cout << repeathd::tagged::Tag(args[1]) << "\n";
    return repeathd::outcome::kExitPass;
}

int RunTagVerify(const std::vector<std::string>& args, const GlobalFlags& flags) {
    if (args.size() > 2) {
        throw UsageError("tag-verify expects at most one <tagged> argument");
    }
    std::string tagged = args.size() == 2 ? args[1] : StripTrailingNewlines(ReadStdinText());
    repeathd::outcome::Outcome result = repeathd::tagged::Verify(tagged);
    if (result.IsPass()) {
        std::cerr << "Verification successful\n";
    } else {
        for (const auto& reason : result.reasons) {
            std::cerr << "Verification failed: " << reason << "\n";
        }
    }
    if (flags.verbose) {
        repeathd::cli::Status(result.status, "tag-verify");
    }
    return repeathd::outcome::ExitCode(result.status);
}

}  // namespace

int main(int argc, char** argv) {
    GlobalFlags flags;
    std::vector<std::string> args = ExtractGlobalFlags(argc, argv, flags);
    if (flags.no_color) {
        repeathd::cli::SetColorsEnabled(false);
    }
    if (args.empty()) {
        PrintUsage(std::cerr);
        return repeathd::outcome::kExitError;
    }
    const std::string& command = args[0];
    try {
        if (command == "encode") {
            return RunEncode(args, flags);
        }
        if (command == "verify") {
            return RunVerify(args, flags);
        }
        if (command == "publichex-verify") {
            return RunPublicHexVerify(args, flags);
        }
        if (command == "tag") {
            return RunTag(args);
        }
        if (command == "tag-verify") {
            return RunTagVerify(args, flags);
        }
        if (command == "version" || command == "--version") {
            std::cout << "repeathd " << repeathd::constants::kEngineVersion << "\n";
            return repeathd::outcome::kExitPass;
        }
        if (command == "help" || command == "--help" || command == "-h") {
            PrintUsage(std::cout);
            return repeathd::outcome::kExitPass;
        }
        repeathd::cli::Warn("Unknown command: " + command);
        PrintUsage(std::cerr);
        return repeathd::outcome::kExitError;
    } catch (const UsageError& exc) {
        std::cerr << "Error: " << exc.what() << "\n";
        PrintUsage(std::cerr);
        return repeathd::outcome::kExitError;
    } catch (const repeathd::InputError& exc) {
        // Unreadable input is still reported through an ERROR capsule.
        return Emit(repeathd::InputFailure(exc.what()), flags, command);
    } catch (const std::exception& exc) {
        std::cerr << "Error: " << exc.what() << "\n";
        return repeathd::outcome::kExitError;
    }
}
