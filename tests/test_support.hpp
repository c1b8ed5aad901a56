#pragma once

#include "kninja/config.hpp"
#include "kninja/graph.hpp"
#include "kninja/project.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>

namespace kninja::test {

inline ProjectConfig test_config(bool use_system_k) {
    ProjectConfig config;
    config.use_system_k = use_system_k;
    if (use_system_k) {
        config.k_release_dir = "/opt/k";
    }
    config.kninja_dir = "share/kninja";
    return config;
}

inline std::unique_ptr<Project> make_project(bool use_system_k = true) {
    auto proj = Project::create(test_config(use_system_k));
    if (!proj) {
        ADD_FAILURE() << proj.error().message;
        return nullptr;
    }
    return std::move(*proj);
}

inline std::string manifest(BuildGraph &graph) {
    std::ostringstream out;
    auto res = graph.flush(out);
    EXPECT_TRUE(res) << res.error().message;
    return out.str();
}

inline size_t count(std::string_view text, std::string_view needle) {
    size_t n = 0;
    for (size_t pos = text.find(needle); pos != std::string_view::npos; pos = text.find(needle, pos + 1)) {
        ++n;
    }
    return n;
}

inline size_t count_edges(const BuildGraph &graph, std::string_view rule) {
    size_t n = 0;
    for (const auto &edge : graph.edges()) {
        if (edge.rule == rule) {
            ++n;
        }
    }
    return n;
}

inline const BuildEdge *edge_producing(const BuildGraph &graph, std::string_view output) {
    for (const auto &edge : graph.edges()) {
        for (const auto &out : edge.outputs) {
            if (out == output) {
                return &edge;
            }
        }
    }
    return nullptr;
}

/** @brief Runs a test inside a fresh scratch directory. */
class ScratchDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        previous_ = std::filesystem::current_path();
        dir_ = std::filesystem::path(::testing::TempDir()) /
               ("kninja_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->test_suite_name()) +
                "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
        std::filesystem::current_path(dir_);
    }

    void TearDown() override {
        std::filesystem::current_path(previous_);
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path previous_;
    std::filesystem::path dir_;
};

} // namespace kninja::test
