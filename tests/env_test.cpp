#include <gtest/gtest.h>
#include <cstdlib>
#include "fnform/env.hpp"
#include "fnform/fn_form.hpp"
#include "test_util.hpp"

using namespace fnform;

TEST(Env, DefaultsOff){
    unsetenv("FNFORM_TRACE");
    unsetenv("FNFORM_DIAG_JSON");
    auto e = detect_env();
    EXPECT_FALSE(e.trace);
    EXPECT_FALSE(e.diagJson);
}

TEST(Env, FlagsAcceptOneYesTrue){
    setenv("FNFORM_TRACE", "1", 1);
    setenv("FNFORM_DIAG_JSON", "yes", 1);
    auto e = detect_env();
    EXPECT_TRUE(e.trace);
    EXPECT_TRUE(e.diagJson);
    setenv("FNFORM_TRACE", "0", 1);
    setenv("FNFORM_DIAG_JSON", "", 1);
    e = detect_env();
    EXPECT_FALSE(e.trace);
    EXPECT_FALSE(e.diagJson);
    unsetenv("FNFORM_TRACE");
    unsetenv("FNFORM_DIAG_JSON");
}

TEST(Env, TraceLogsParseDecisions){
    setenv("FNFORM_TRACE", "1", 1);
    auto forms = fnform_test::must_read_all("f ([] 0) ([a] a)");
    testing::internal::CaptureStderr();
    auto fn = parse_fn(forms_ref(forms));
    std::string err = testing::internal::GetCapturedStderr();
    unsetenv("FNFORM_TRACE");
    ASSERT_TRUE(static_cast<bool>(fn));
    EXPECT_NE(err.find("[dbg][parse-clauses] shape=multi forms=2"), std::string::npos);
    EXPECT_NE(err.find("[dbg][parse-fn] name=f clauses=2"), std::string::npos);
}
