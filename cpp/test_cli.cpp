// Runs the repeathd binary (path in argv[1]) against raw byte files and stdin.
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <sys/wait.h>

#include "repeathd/repeathd.hpp"

namespace {

int g_failures = 0;

void Expect(bool ok, const std::string& what) {
    std::cout << (ok ? "  ok    " : "  FAIL  ") << what << std::endl;
    if (!ok) {
        ++g_failures;
    }
}

struct CliRun {
    int code = -1;
    std::string out;
    std::string err;
};

std::string Slurp(const std::string& path) {
    std::vector<std::uint8_t> data = repeathd::ReadFile(path);
    return std::string(data.begin(), data.end());
}

CliRun RunCli(const std::string& exe, const std::string& args, const std::string& stdin_path = "/dev/null") {
    std::string command = "\"" + exe + "\" " + args + " < " + stdin_path + " > cli_stdout.txt 2> cli_stderr.txt";
    int status = std::system(command.c_str());
    CliRun run;
    if (status != -1 && WIFEXITED(status)) {
        run.code = WEXITSTATUS(status);
    }
    run.out = Slurp("cli_stdout.txt");
    run.err = Slurp("cli_stderr.txt");
    return run;
}

bool Has(const std::string& text, const std::string& fragment) {
    return text.find(fragment) != std::string::npos;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: test_cli <path-to-repeathd>" << std::endl;
        return 1;
    }
    const std::string exe = argv[1];

    std::cout << "File round trip:" << std::endl;
    CliRun encoded = RunCli(exe, "--no-color encode hello --out cli_frame.bin");
    Expect(encoded.code == 0, "encode --out exits 0");
    Expect(repeathd::ReadFile("cli_frame.bin") == repeathd::frame::Encode(std::string_view("hello")),
           "encode --out writes the raw wire frame");
    CliRun verified = RunCli(exe, "--no-color verify --file cli_frame.bin --strict");
    Expect(verified.code == 0 && Has(verified.out, "\"normalized_frame_hex\": \"86a610360500000068656c6c6f\""),
           "verify --file --strict passes the written frame");

    std::cout << "Binary payloads:" << std::endl;
    std::vector<std::uint8_t> payload = {0xFF, 0x00, 'a', 0x0A, 0x0D};
    std::vector<std::uint8_t> wire = repeathd::frame::Encode(payload);
    repeathd::WriteFile("cli_payload.bin", payload);
    CliRun from_file = RunCli(exe, "--no-color encode --file cli_payload.bin --out cli_binary.bin");
    Expect(from_file.code == 0 && Has(from_file.out, repeathd::hex::HexEncode(wire)),
           "encode --file frames the bytes unaltered");
    Expect(repeathd::ReadFile("cli_binary.bin") == wire, "binary frame on disk matches the library encoding");
    CliRun from_stdin = RunCli(exe, "--no-color encode", "cli_payload.bin");
    Expect(from_stdin.code == 0 && Has(from_stdin.out, repeathd::hex::HexEncode(wire)),
           "encode from stdin frames the bytes unaltered");

    CliRun plain = RunCli(exe, "--no-color verify --no-strict", "cli_binary.bin");
    Expect(plain.code == 0, "binary frame on stdin passes basic verification");
    CliRun strict = RunCli(exe, "--no-color verify --strict", "cli_binary.bin");
    Expect(strict.code == 2, "binary frame on stdin fails strict verification");
    Expect(Has(strict.err, "payload is not valid UTF-8") && Has(strict.err, "payload contains a NUL byte"),
           "strict errors list both violations on stderr");
    Expect(Has(strict.out, repeathd::hex::HexEncode(wire)), "strict FAIL still prints the capsule");

    repeathd::WriteFile("cli_short.bin", {1, 2, 3, 4, 5});
    CliRun short_run = RunCli(exe, "--no-color verify", "cli_short.bin");
    Expect(short_run.code == 1 && Has(short_run.out, "\"errors\": [\"too short\"]"), "5 raw stdin bytes are an ERROR");

    std::cout << "Flags and unreadable input:" << std::endl;
    CliRun trailing_flag = RunCli(exe, "encode -v");
    Expect(trailing_flag.code == 1 && Has(trailing_flag.err, "Unknown flag: -v"),
           "a global flag after the command is rejected");
    CliRun leading_flag = RunCli(exe, "--no-color --verbose encode hello");
    Expect(leading_flag.code == 0 && Has(leading_flag.err, "PASS encode"), "global flags before the command apply");

    CliRun missing = RunCli(exe, "--no-color verify --file cli_missing.bin");
    Expect(missing.code == 1, "missing input file exits 1");
    Expect(Has(missing.out, "\"normalized_frame_hex\": \"\"") && Has(missing.out, "Failed to open file: cli_missing.bin"),
           "missing input file prints an ERROR capsule");

    for (const char* path : {"cli_frame.bin", "cli_payload.bin", "cli_binary.bin", "cli_short.bin",
                             "cli_stdout.txt", "cli_stderr.txt"}) {
        std::remove(path);
    }

    std::cout << (g_failures == 0 ? "All CLI checks passed" : "CLI checks failed") << std::endl;
    return g_failures == 0 ? 0 : 1;
}
