#include "repeathd/tagged.hpp"

#include "repeathd/constants.hpp"
#include "repeathd/crypto.hpp"
#include "repeathd/hex.hpp"

namespace repeathd::tagged {

namespace {

std::string DigestHex(std::string_view text) {
    return hex::HexEncode(crypto::Sha256(text));
}

}  // namespace

std::string Tag(std::string_view text) {
    std::string out(text);
    out.push_back(constants::kTagSeparator);
    out += DigestHex(text);
    return out;
}

outcome::Outcome Verify(std::string_view tagged) {
    std::size_t split = tagged.rfind(constants::kTagSeparator);
    if (split == std::string_view::npos) {
        return outcome::Outcome::MakeError({"missing ':' separator before checksum"});
    }
    std::string_view text = tagged.substr(0, split);
    std::string_view expected = tagged.substr(split + 1);
    std::string actual = DigestHex(text);
    if (expected != actual) {
        return outcome::Outcome::MakeFail({"sha256 mismatch: expected " + std::string(expected)
                                           + ", got " + actual});
    }
    return outcome::Outcome::MakePass();
}

}  // namespace repeathd::tagged
