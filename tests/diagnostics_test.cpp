#include <gtest/gtest.h>
#include <cstdlib>
#include "fnform/diagnostics_json.hpp"
#include "fnform/defn_form.hpp"
#include "fnform/transform.hpp"
#include "test_util.hpp"

using namespace fnform;
using fnform_test::must_read;

namespace {
// JSON of the form_error held by e.
template<typename T>
std::string json_of(llvm::Expected<T> e){
    if(e) return "ok";
    std::string out;
    llvm::handleAllErrors(e.takeError(), [&](const form_error& fe){ out = diagnostic_to_json(fe); });
    return out;
}
}

TEST(Diagnostics, JsonEscape){
    EXPECT_EQ(json_escape("a\"b\\c\n"), "\"a\\\"b\\\\c\\n\"");
    EXPECT_EQ(json_escape(std::string("\x01", 1)), "\"\\u0001\"");
}

TEST(Diagnostics, JsonCarriesCodeAndReaderPosition){
    auto form = must_read("(defn\n  \"oops\" [x] x)");
    EXPECT_EQ(json_of(parse_defn_form(form)),
              "{\"code\":\"missing-name\",\"message\":\"first argument to defn must be a symbol, got \\\"oops\\\"\",\"line\":2,\"col\":3}");
}

TEST(Diagnostics, JsonWithoutPosition){
    EXPECT_EQ(json_of(parse_defn(forms_ref())),
              "{\"code\":\"missing-name\",\"message\":\"first argument to defn must be a symbol, got nothing\",\"line\":-1,\"col\":-1}");
}

TEST(Diagnostics, ErrcNames){
    EXPECT_STREQ(errc_name(form_errc::missing_name), "missing-name");
    EXPECT_STREQ(errc_name(form_errc::missing_parameters), "missing-parameters");
    EXPECT_STREQ(errc_name(form_errc::malformed_signature), "malformed-signature");
    EXPECT_STREQ(errc_name(form_errc::ambiguous_signature), "ambiguous-signature");
}

TEST(Diagnostics, LogIncludesPosition){
    auto form = must_read("(defn [x] x)");
    auto d = parse_defn_form(form);
    ASSERT_FALSE(d);
    EXPECT_EQ(llvm::toString(d.takeError()), "first argument to defn must be a symbol, got [x] (line 1, col 7)");
}

TEST(Diagnostics, ExpansionFailurePrintsJsonWhenEnabled){
    setenv("FNFORM_DIAG_JSON", "1", 1);
    transformer tx;
    register_definition_macros(tx);
    testing::internal::CaptureStderr();
    auto out = tx.expand(must_read("(defn- 42 [x] x)"));
    std::string err = testing::internal::GetCapturedStderr();
    unsetenv("FNFORM_DIAG_JSON");
    EXPECT_EQ(fnform_test::errc_of(std::move(out)), form_errc::missing_name);
    EXPECT_NE(err.find("\"code\":\"missing-name\""), std::string::npos);
    EXPECT_NE(err.find("\"line\":1,\"col\":8"), std::string::npos);
}

TEST(Diagnostics, ExpansionFailureSilentByDefault){
    unsetenv("FNFORM_DIAG_JSON");
    transformer tx;
    register_definition_macros(tx);
    testing::internal::CaptureStderr();
    auto out = tx.expand(must_read("(defn- 42 [x] x)"));
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_EQ(fnform_test::errc_of(std::move(out)), form_errc::missing_name);
    EXPECT_EQ(err.find("missing-name"), std::string::npos);
}
