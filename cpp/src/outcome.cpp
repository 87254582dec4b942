#include "repeathd/outcome.hpp"

#include <utility>

namespace repeathd::outcome {

Outcome Outcome::MakePass() {
    return Outcome{};
}

Outcome Outcome::MakeFail(std::vector<std::string> reasons) {
    Outcome result;
    result.status = Status::Fail;
    result.reasons = std::move(reasons);
    return result;
}

Outcome Outcome::MakeError(std::vector<std::string> reasons) {
    Outcome result;
    result.status = Status::Error;
    result.reasons = std::move(reasons);
    return result;
}

int ExitCode(Status status) {
    switch (status) {
        case Status::Pass:  return kExitPass;
        case Status::Fail:  return kExitFail;
        case Status::Error: return kExitError;
    }
    return kExitError;
}

const char* StatusName(Status status) {
    switch (status) {
        case Status::Pass:  return "PASS";
        case Status::Fail:  return "FAIL";
        case Status::Error: return "ERROR";
    }
    return "ERROR";
}

}  // namespace repeathd::outcome
