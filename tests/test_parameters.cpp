/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/argument_parser.hpp"
#include "core/parameters.hpp"
#include "polar/xc_dh.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>

using namespace dhr::core;
namespace fs = std::filesystem;
namespace polar = dhr::polar;

class ParametersTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("dhr_parameters_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir_);
    }

    void TearDown() override { fs::remove_all(dir_); }

    fs::path write_json(const std::string& name, const std::string& text) {
        const auto path = dir_ / name;
        std::ofstream(path) << text;
        return path;
    }

    fs::path dir_;
};

// ============= JSON =============

TEST_F(ParametersTest, SaveAndLoadPreservesFields) {
    param::PolarParameters params;
    params.xc = "XYGJOS";
    params.max_memory_mb = 123.5;
    params.cpks_tol = 1e-10;
    params.parallel_contractions = true;
    params.log_level = "debug";
    params.log_modules = {{"store", "trace"}, {"stage", "off"}};
    params.synthetic.nocc = 3;
    params.synthetic.xc_family = "LDA";
    params.synthetic.seed = 99;

    const auto path = dir_ / "params.json";
    ASSERT_TRUE(param::save_parameters(params, path));
    auto loaded = param::load_parameters(path);
    ASSERT_TRUE(loaded) << loaded.error();

    EXPECT_EQ(loaded->xc, "XYGJOS");
    EXPECT_DOUBLE_EQ(loaded->max_memory_mb, 123.5);
    EXPECT_DOUBLE_EQ(loaded->cpks_tol, 1e-10);
    EXPECT_TRUE(loaded->parallel_contractions);
    EXPECT_EQ(loaded->log_level, "debug");
    EXPECT_EQ(loaded->log_modules, params.log_modules);
    EXPECT_EQ(loaded->synthetic.nocc, 3);
    EXPECT_EQ(loaded->synthetic.xc_family, "LDA");
    EXPECT_EQ(loaded->synthetic.seed, 99u);
}

TEST_F(ParametersTest, MissingFieldsKeepDefaults) {
    const auto path = write_json("partial.json", R"({"xc": "B2PLYP", "synthetic": {"nvir": 6}})");
    auto loaded = param::load_parameters(path);
    ASSERT_TRUE(loaded) << loaded.error();

    const param::PolarParameters defaults;
    EXPECT_EQ(loaded->xc, "B2PLYP");
    EXPECT_EQ(loaded->synthetic.nvir, 6);
    EXPECT_EQ(loaded->synthetic.nocc, defaults.synthetic.nocc);
    EXPECT_DOUBLE_EQ(loaded->max_memory_mb, defaults.max_memory_mb);
}

TEST_F(ParametersTest, LoadErrors) {
    EXPECT_FALSE(param::load_parameters(dir_ / "missing.json"));

    const auto broken = write_json("broken.json", "{ not json");
    EXPECT_FALSE(param::load_parameters(broken));

    const auto invalid = write_json("invalid.json", R"({"max_memory_mb": -1})");
    auto result = param::load_parameters(invalid);
    ASSERT_FALSE(result);
    EXPECT_NE(result.error().find("max_memory_mb"), std::string::npos);
}

TEST_F(ParametersTest, ValidateNamesOffendingField) {
    auto check = [](auto mutate, const std::string& field) {
        param::PolarParameters p;
        mutate(p);
        auto ok = param::validate(p);
        ASSERT_FALSE(ok) << field;
        EXPECT_NE(ok.error().find(field), std::string::npos) << ok.error();
    };

    EXPECT_TRUE(param::validate(param::PolarParameters{}));
    check([](auto& p) { p.xc.clear(); }, "xc");
    check([](auto& p) { p.cpks_max_cycle = 0; }, "cpks_max_cycle");
    check([](auto& p) { p.cpks_tol = 0.0; }, "cpks_tol");
    check([](auto& p) { p.log_level = "loud"; }, "log_level");
    check([](auto& p) { p.log_modules["gpu"] = "debug"; }, "gpu");
    check([](auto& p) { p.log_modules["store"] = "chatty"; }, "chatty");
    check([](auto& p) { p.checkpoint_dataset = "a.h5"; }, "checkpoint_metadata");
    check([](auto& p) { p.synthetic.naux = 0; }, "naux");
    check([](auto& p) { p.synthetic.xc_family = "MGGA"; }, "xc_family");
}

// ============= Functional table =============

TEST(XcDoublyHybridTest, NameNormalization) {
    EXPECT_EQ(polar::normalize_xc_name("XYG-3"), "xyg3");
    EXPECT_EQ(polar::normalize_xc_name("xDH_PBE0"), "xdhpbe0");
}

TEST(XcDoublyHybridTest, Xyg3Decomposition) {
    auto xc = polar::parse_xc_dh("XYG3");
    ASSERT_TRUE(xc);
    EXPECT_EQ(xc->xc_s, "B3LYPg");
    ASSERT_TRUE(xc->xc_n.has_value());
    EXPECT_DOUBLE_EQ(xc->cc, 0.3211);
    EXPECT_DOUBLE_EQ(xc->c_os, 1.0);
    EXPECT_DOUBLE_EQ(xc->c_ss, 1.0);
}

TEST(XcDoublyHybridTest, SelfConsistentFunctionalsHaveNoNonConsistentPart) {
    auto mp2 = polar::parse_xc_dh("MP2");
    ASSERT_TRUE(mp2);
    EXPECT_EQ(mp2->xc_s, "HF");
    EXPECT_FALSE(mp2->xc_n.has_value());

    auto b2plyp = polar::parse_xc_dh("b2plyp");
    ASSERT_TRUE(b2plyp);
    EXPECT_FALSE(b2plyp->xc_n.has_value());
    EXPECT_DOUBLE_EQ(b2plyp->cc, 0.27);

    auto jos = polar::parse_xc_dh("XYGJ-OS");
    ASSERT_TRUE(jos);
    EXPECT_DOUBLE_EQ(jos->c_ss, 0.0);
}

TEST(XcDoublyHybridTest, UnknownFunctional) {
    auto xc = polar::parse_xc_dh("B3LYP");
    ASSERT_FALSE(xc);
    EXPECT_NE(xc.error().find("B3LYP"), std::string::npos);
    EXPECT_FALSE(polar::known_xc_dh().empty());
}

// ============= Command line =============

class ArgumentParserTest : public ParametersTest {
protected:
    template <size_t N>
    static std::expected<args::ParsedArgs, std::string> parse(const char* const (&argv)[N]) {
        return args::parse_args(static_cast<int>(N), argv);
    }

    static const param::PolarParameters& params_of(const args::ParsedArgs& parsed) {
        return *std::get<args::PolarMode>(parsed).params;
    }
};

TEST_F(ArgumentParserTest, DefaultsWithoutOptions) {
    const char* const argv[] = {"dhr_polar"};
    auto parsed = parse(argv);
    ASSERT_TRUE(parsed) << parsed.error();
    ASSERT_TRUE(std::holds_alternative<args::PolarMode>(*parsed));
    EXPECT_EQ(params_of(*parsed).xc, param::PolarParameters{}.xc);
}

TEST_F(ArgumentParserTest, OptionsOverrideConfig) {
    const auto config = write_json("cfg.json", R"({"xc": "MP2", "max_memory_mb": 10, "synthetic": {"nocc": 2}})");
    const auto config_str = config.string();
    const char* const argv[] = {"dhr_polar", "--config", config_str.c_str(), "--xc=xDH-PBE0",
                                "--nvir", "7", "--lda", "--parallel", "--checkpoint", "/tmp/run"};
    auto parsed = parse(argv);
    ASSERT_TRUE(parsed) << parsed.error();

    const auto& p = params_of(*parsed);
    EXPECT_EQ(p.xc, "xDH-PBE0");
    EXPECT_DOUBLE_EQ(p.max_memory_mb, 10.0);
    EXPECT_EQ(p.synthetic.nocc, 2);
    EXPECT_EQ(p.synthetic.nvir, 7);
    EXPECT_EQ(p.synthetic.xc_family, "LDA");
    EXPECT_TRUE(p.parallel_contractions);
    EXPECT_EQ(fs::path(p.checkpoint_dataset), fs::path("/tmp/run") / "tensors.h5");
    EXPECT_EQ(fs::path(p.checkpoint_metadata), fs::path("/tmp/run") / "tensors.dat");
}

TEST_F(ArgumentParserTest, ModuleLogLevels) {
    const auto config = write_json("cfg.json", R"({"log_modules": {"store": "warn", "app": "error"}})");
    const auto config_str = config.string();
    const char* const argv[] = {"dhr_polar", "--config", config_str.c_str(), "--log-module", "store=trace",
                                "--log-module=stage=off"};
    auto parsed = parse(argv);
    ASSERT_TRUE(parsed) << parsed.error();

    const auto& modules = params_of(*parsed).log_modules;
    ASSERT_EQ(modules.size(), 3);
    EXPECT_EQ(modules.at("store"), "trace");
    EXPECT_EQ(modules.at("stage"), "off");
    EXPECT_EQ(modules.at("app"), "error");

    const char* const no_level[] = {"dhr_polar", "--log-module", "store"};
    EXPECT_FALSE(parse(no_level));

    const char* const unknown_module[] = {"dhr_polar", "--log-module", "gpu=debug"};
    auto rejected = parse(unknown_module);
    ASSERT_FALSE(rejected);
    EXPECT_NE(rejected.error().find("gpu"), std::string::npos);
}

TEST_F(ArgumentParserTest, HelpMode) {
    const char* const argv[] = {"dhr_polar", "--xc", "XYG3", "--help"};
    auto parsed = parse(argv);
    ASSERT_TRUE(parsed);
    EXPECT_TRUE(std::holds_alternative<args::HelpMode>(*parsed));
}

TEST_F(ArgumentParserTest, Errors) {
    const char* const unknown[] = {"dhr_polar", "--frobnicate"};
    EXPECT_FALSE(parse(unknown));

    const char* const missing_value[] = {"dhr_polar", "--nocc"};
    EXPECT_FALSE(parse(missing_value));

    const char* const bad_number[] = {"dhr_polar", "--nocc", "three"};
    auto parsed = parse(bad_number);
    ASSERT_FALSE(parsed);
    EXPECT_NE(parsed.error().find("--nocc"), std::string::npos);

    const char* const flag_value[] = {"dhr_polar", "--parallel=yes"};
    EXPECT_FALSE(parse(flag_value));

    const char* const positional[] = {"dhr_polar", "input.json"};
    EXPECT_FALSE(parse(positional));

    const char* const invalid[] = {"dhr_polar", "--max-memory", "0"};
    EXPECT_FALSE(parse(invalid));
}
