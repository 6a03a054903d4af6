#include "text.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

#include <stdlib.h>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "text_test failure: " << msg << std::endl;
    std::exit(1);
}

} // namespace

int main() {
    using namespace fd;

    if (trim("  round-7\t\n") != "round-7") {
        fail("trim should strip surrounding whitespace");
    }
    if (!trim(" \t ").empty()) {
        fail("trim of whitespace should be empty");
    }
    if (trim("a b") != "a b") {
        fail("trim must keep inner whitespace");
    }

    unsetenv("FD_TEXT_TEST");
    if (readEnv("FD_TEXT_TEST")) {
        fail("unset variable should read as nullopt");
    }
    setenv("FD_TEXT_TEST", "  deploy-1 ", 1);
    const auto value = readEnv("FD_TEXT_TEST");
    if (!value || *value != "deploy-1") {
        fail("set variable should read trimmed");
    }
    unsetenv("FD_TEXT_TEST");

    if (jsonEscape("plain-id") != "plain-id") {
        fail("plain text should pass through");
    }
    if (jsonEscape("a\"b\\c") != "a\\\"b\\\\c") {
        fail("quote and backslash must be escaped");
    }
    if (jsonEscape("x\ny\tz") != "x\\ny\\tz") {
        fail("newline and tab must be escaped");
    }
    if (jsonEscape(std::string("\x01", 1)) != "\\u0001") {
        fail("control characters must use \\u escapes");
    }
    // A crafted id must not be able to inject a JSON member.
    const std::string injected = jsonEscape("r1\",\"secret\":\"x");
    if (injected.find("\",\"") != std::string::npos) {
        fail("escaped id still closes the string");
    }

    std::cout << "text_test passed" << std::endl;
    return 0;
}
