/**
 * test_command_registry.cpp - Unit tests for CommandRegistry
 */

#include "ut/CommandRegistry.hpp"
#include "ut/Handlers.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <set>
#include <stdexcept>

void test_lookup_canonical_and_alias() {
    auto registry = ut::CommandRegistry::withDefaults();

    const ut::CommandSpec* del = registry->lookup("del");
    assert(del != nullptr);
    assert(registry->lookup("rm") == del);
    assert(registry->lookup("erase") == del);
    assert(registry->lookup("ls")->name == "dir");

    std::cout << "[PASS] test_lookup_canonical_and_alias\n";
}

void test_lookup_is_case_insensitive() {
    auto registry = ut::CommandRegistry::withDefaults();

    assert(registry->lookup("MKDIR") != nullptr);
    assert(registry->lookup("Md")->name == "mkdir");
    assert(registry->isKnown("TaskList"));

    std::cout << "[PASS] test_lookup_is_case_insensitive\n";
}

void test_lookup_unknown() {
    auto registry = ut::CommandRegistry::withDefaults();

    assert(registry->lookup("make") == nullptr);
    assert(registry->lookup("") == nullptr);
    assert(!registry->isKnown("sudo"));

    std::cout << "[PASS] test_lookup_unknown\n";
}

void test_default_command_set() {
    auto registry = ut::CommandRegistry::withDefaults();

    const std::vector<std::string> expected = {
        "cd", "cls", "copy", "cpu", "del", "dir", "echo", "exit", "help", "history",
        "ipconfig", "mem", "mkdir", "move", "netstat", "ping", "pwd", "ren", "rmdir",
        "taskkill", "tasklist", "touch", "type"
    };
    assert(registry->canonicalNames() == expected);
    assert(registry->size() == expected.size());

    // Every alias maps to exactly one command
    auto names = registry->allNames();
    std::set<std::string> unique(names.begin(), names.end());
    assert(unique.size() == names.size());
    assert(std::is_sorted(names.begin(), names.end()));

    std::cout << "[PASS] test_default_command_set\n";
}

void test_arity_checks() {
    auto registry = ut::CommandRegistry::withDefaults();

    const ut::CommandSpec* copy = registry->lookup("copy");
    copy->checkArity({"a", "b"});

    bool threw = false;
    try {
        copy->checkArity({"a"});
    } catch (const ut::ValidationError& e) {
        threw = true;
        assert(std::string(e.what()).find("Usage: copy <source> <destination>") != std::string::npos);
    }
    assert(threw);

    threw = false;
    try {
        registry->lookup("pwd")->checkArity({"extra"});
    } catch (const ut::ValidationError& e) {
        threw = true;
        assert(e.kind() == ut::ErrorKind::Validation);
    }
    assert(threw);

    // Variadic
    registry->lookup("echo")->checkArity({});
    registry->lookup("mkdir")->checkArity({"a", "b", "c", "d", "e", "f"});

    std::cout << "[PASS] test_arity_checks\n";
}

void test_duplicate_alias_rejected() {
    ut::CommandRegistry registry;
    registry.add({"dir", {"ls"}, 0, 1, "[path]", "List", ut::makeListDirectoryHandler()});

    bool threw = false;
    try {
        registry.add({"list", {"LS"}, 0, 1, "[path]", "List again", ut::makeListDirectoryHandler()});
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);
    assert(registry.size() == 1);
    assert(registry.lookup("list") == nullptr);

    std::cout << "[PASS] test_duplicate_alias_rejected\n";
}

void test_spec_without_handler_rejected() {
    ut::CommandRegistry registry;

    bool threw = false;
    try {
        registry.add({"noop", {}, 0, 0, "", "Nothing", nullptr});
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        registry.add({"bad", {}, 2, 1, "", "Bad arity", ut::makeEchoHandler()});
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[PASS] test_spec_without_handler_rejected\n";
}

int main() {
    std::cout << "Running CommandRegistry tests...\n\n";

    test_lookup_canonical_and_alias();
    test_lookup_is_case_insensitive();
    test_lookup_unknown();
    test_default_command_set();
    test_arity_checks();
    test_duplicate_alias_rejected();
    test_spec_without_handler_rejected();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
