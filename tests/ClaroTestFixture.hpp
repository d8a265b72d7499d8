// ClaroTestFixture.hpp
#pragma once
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "Claro.hpp"
#include "Error.hpp"

// Runs snippets on a fresh interpreter and exposes its output buffer.
class ClaroTest : public ::testing::Test {
protected:
    void SetUp() override {
        Error::clear();
    }

    void TearDown() override {
        Error::clear();
    }

    bool run(const std::string& source) {
        return vm.run_source(source);
    }

    const std::vector<std::string>& out() const {
        return vm.output;
    }

    ClaroInterpreter vm;
};
