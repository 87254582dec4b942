#pragma once

#include <string>
#include <vector>

namespace repeathd::outcome {

enum class Status {
    Pass,
    Fail,
    Error,
};

// Process exit codes shared by every verification command.
inline constexpr int kExitPass = 0;
inline constexpr int kExitError = 1;
inline constexpr int kExitFail = 2;

struct Outcome {
    Status status = Status::Pass;
    std::vector<std::string> reasons;

    static Outcome MakePass();
    static Outcome MakeFail(std::vector<std::string> reasons);
    static Outcome MakeError(std::vector<std::string> reasons);

    bool IsPass() const { return status == Status::Pass; }
};

int ExitCode(Status status);
const char* StatusName(Status status);

}  // namespace repeathd::outcome
