#include <gtest/gtest.h>
#include "fnform/reader.hpp"
#include "test_util.hpp"

using namespace fnform;
using fnform_test::must_read;
using fnform_test::must_read_all;

namespace {
// Consume a read failure and return it as "line:col message".
std::string read_failure(std::string_view src){
    auto n = read(src, "t.edn");
    if(n) return "ok";
    std::string out;
    llvm::handleAllErrors(n.takeError(), [&](const read_error& e){
        out = std::to_string(e.line()) + ":" + std::to_string(e.column()) + " " + e.text();
        EXPECT_EQ(e.source(), "t.edn");
    });
    return out;
}
}

TEST(Reader, Atoms){
    EXPECT_TRUE(std::holds_alternative<symbol>(must_read("foo-bar?")->data));
    EXPECT_TRUE(std::holds_alternative<keyword>(must_read(":pre")->data));
    EXPECT_EQ(std::get<keyword>(must_read(":pre")->data).name, "pre");
    EXPECT_EQ(std::get<int64_t>(must_read("-42")->data), -42);
    EXPECT_DOUBLE_EQ(std::get<double>(must_read("1.5e2")->data), 150.0);
    EXPECT_EQ(std::get<std::string>(must_read("\"a\\tb\\n\"")->data), "a\tb\n");
    EXPECT_TRUE(std::holds_alternative<std::monostate>(must_read("nil")->data));
    EXPECT_EQ(std::get<bool>(must_read("false")->data), false);
    EXPECT_EQ(std::get<symbol>(must_read("-")->data).name, "-");
    EXPECT_EQ(std::get<symbol>(must_read("+x")->data).name, "+x");
}

TEST(Reader, Collections){
    auto n = must_read("(fn ([] 0) ([a] {:post [(pos? %)]} 1))");
    ASSERT_TRUE(is_list(*n));
    auto& elems = std::get<list>(n->data).elems;
    ASSERT_EQ(elems.size(), 3u);
    auto& second = std::get<list>(elems[2]->data).elems;
    EXPECT_TRUE(is_vector(*second[0]));
    EXPECT_TRUE(is_map(*second[1]));
    auto t = must_read("#inst \"2020-01-01\"");
    ASSERT_TRUE(std::holds_alternative<tagged_value>(t->data));
    EXPECT_EQ(std::get<tagged_value>(t->data).tag.name, "inst");
}

TEST(Reader, CommentsCommasAndDiscard){
    auto n = must_read("; leading comment\n[a, b #_ c #_ #_ d e f] ; trailing");
    EXPECT_TRUE(equal(n, node_vec({ n_sym("a"), n_sym("b"), n_sym("f") })));
}

TEST(Reader, Positions){
    auto n = must_read("(defn f\n  [x]\n  x)");
    EXPECT_EQ(line(*n), 1);
    EXPECT_EQ(col(*n), 1);
    EXPECT_EQ(end_line(*n), 3);
    EXPECT_EQ(end_col(*n), 4);
    auto& params = std::get<list>(n->data).elems[2];
    EXPECT_EQ(line(*params), 2);
    EXPECT_EQ(col(*params), 3);
    EXPECT_EQ(end_col(*params), 5);
}

TEST(Reader, ReadAll){
    auto forms = must_read_all("[x] (+ x 1)\n");
    ASSERT_EQ(forms.size(), 2u);
    EXPECT_TRUE(is_vector(*forms[0]));
    EXPECT_TRUE(must_read_all("  ; nothing here\n").empty());
}

TEST(Reader, Errors){
    EXPECT_EQ(read_failure("(a b"), "1:5 unterminated list, expected ')'");
    EXPECT_EQ(read_failure("[a\n b"), "2:3 unterminated vector, expected ']'");
    EXPECT_EQ(read_failure("\"abc"), "1:5 unterminated string");
    EXPECT_EQ(read_failure("a b"), "1:3 unexpected trailing characters");
    EXPECT_EQ(read_failure(""), "1:1 expected a form");
    EXPECT_NE(read_failure("{:a}").find("map requires an even number of forms"), std::string::npos);
    EXPECT_NE(read_failure("{:a 1 :a 2}").find("duplicate map key :a"), std::string::npos);
}
