#include <iostream>
#include <string>

#include "repeathd/outcome.hpp"
#include "repeathd/tagged.hpp"

namespace {

int g_failures = 0;

void Expect(bool ok, const std::string& what) {
    std::cout << (ok ? "  ok    " : "  FAIL  ") << what << std::endl;
    if (!ok) {
        ++g_failures;
    }
}

}  // namespace

int main() {
    using repeathd::outcome::Status;
    using repeathd::tagged::Tag;
    using repeathd::tagged::Verify;

    std::string hello = Tag("hello");
    Expect(hello == "hello:2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824",
           "hello is tagged with its sha256");
    Expect(Verify(hello).status == Status::Pass, "a fresh tag verifies");
    Expect(Verify(Tag("test message")).IsPass(), "tags round trip");
    Expect(Verify(Tag("a:b:c")).IsPass(), "text may contain the separator");
    Expect(Verify(Tag("")).IsPass(), "empty text can be tagged");
    Expect(Verify("hello:wrongchecksum").status == Status::Fail, "a wrong digest is a FAIL");
    Expect(Verify("hello").status == Status::Error, "text without a separator is an ERROR");

    std::string tampered = hello;
    tampered[0] = 'j';
    Expect(Verify(tampered).status == Status::Fail, "changing the text breaks the tag");

    std::cout << (g_failures == 0 ? "All tagged checks passed" : "Tagged checks failed") << std::endl;
    return g_failures == 0 ? 0 : 1;
}
