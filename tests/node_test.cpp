#include <gtest/gtest.h>
#include "fnform/node.hpp"
#include "test_util.hpp"

using namespace fnform;
using fnform_test::must_read;

TEST(Node, EqualIgnoresMetadataByDefault){
    auto a = must_read("(+ x 1)");
    auto b = node_list({ n_sym("+"), n_sym("x"), n_i64(1) });
    EXPECT_TRUE(equal(a, b));
    EXPECT_FALSE(equal(a, b, /*ignore_metadata=*/false));
}

TEST(Node, EqualDistinguishesShapes){
    EXPECT_FALSE(equal(must_read("[x]"), must_read("(x)")));
    EXPECT_FALSE(equal(must_read("[x y]"), must_read("[y x]")));
    EXPECT_FALSE(equal(n_i64(1), n_f64(1.0)));
    EXPECT_FALSE(equal(n_sym("a"), nullptr));
    EXPECT_TRUE(equal(nullptr, nullptr));
}

TEST(Node, MapsAndSetsCompareWithoutOrder){
    EXPECT_TRUE(equal(must_read("{:a 1 :b 2}"), must_read("{:b 2 :a 1}")));
    EXPECT_TRUE(equal(must_read("#{1 2 3}"), must_read("#{3 1 2}")));
    EXPECT_FALSE(equal(must_read("{:a 1}"), must_read("{:a 2}")));
}

TEST(Node, CloneSharesNothing){
    auto src = must_read("(f [a b] {:pre [(pos? a)]} #tag (g a))");
    auto copy = clone(src);
    EXPECT_TRUE(equal(src, copy, false));
    ASSERT_NE(src.get(), copy.get());
    auto& se = std::get<list>(src->data).elems;
    auto& ce = std::get<list>(copy->data).elems;
    for(size_t i = 0; i < se.size(); ++i) EXPECT_NE(se[i].get(), ce[i].get());
    // mutate the copy, the source is untouched
    std::get<vector_t>(ce[1]->data).elems.push_back(n_sym("c"));
    EXPECT_TRUE(equal(se[1], must_read("[a b]")));
}

TEST(Node, OpaqueClassification){
    EXPECT_FALSE(is_opaque(*n_sym("x")));
    EXPECT_FALSE(is_opaque(*node_vec()));
    EXPECT_FALSE(is_opaque(*node_list()));
    EXPECT_FALSE(is_opaque(*node_map()));
    EXPECT_FALSE(is_opaque(*n_str("doc")));
    EXPECT_TRUE(is_opaque(*n_i64(3)));
    EXPECT_TRUE(is_opaque(*n_kw("k")));
    EXPECT_TRUE(is_opaque(*n_nil()));
    EXPECT_TRUE(is_opaque(*node_set({ n_i64(1) })));
}

TEST(Node, MapAssocReplacesInPlace){
    map m;
    m << kvp(n_kw("doc"), n_str("a")) << kvp(n_kw("private"), n_bool(true));
    map_assoc(m, n_kw("doc"), n_str("b"));
    ASSERT_EQ(m.entries.size(), 2u);
    EXPECT_TRUE(equal(m.entries[0].second, n_str("b")));
    EXPECT_TRUE(equal(map_get(m, n_kw("private")), n_bool(true)));
    EXPECT_EQ(map_get(m, n_kw("missing")), nullptr);
}

TEST(Node, CompactPrinter){
    EXPECT_EQ(to_string(must_read("(defn f {:doc \"say \\\"hi\\\"\"} [x] (+ x 1.5))")),
              "(defn f {:doc \"say \\\"hi\\\"\"} [x] (+ x 1.5))");
    EXPECT_EQ(to_string(must_read("#{:a} #_ignored")), "#{:a}");
    EXPECT_EQ(to_string(n_f64(2.0)), "2.0");
    EXPECT_EQ(to_string(node_ptr{}), "nil");
}

TEST(Node, PrettyPrinterBreaksDefinitions){
    auto s = to_pretty_string(must_read("(defn f [x] (+ x 1))"));
    EXPECT_EQ(s, "(\n  defn\n  f\n  [x]\n  (+ x 1)\n)");
    EXPECT_EQ(to_pretty_string(must_read("[a b c]")), "[a b c]");
}

TEST(Node, PrettyPrinterToleratesNullChildren){
    EXPECT_EQ(to_pretty_string(node_vec({ n_sym("a"), nullptr })), "[a nil]");
    auto s = to_pretty_string(node_list({ n_sym("defn"), nullptr, node_vec({}) }));
    EXPECT_EQ(s, "(\n  defn\n  nil\n  []\n)");
    EXPECT_EQ(to_pretty_string(node_list({ nullptr, n_i64(1) })), "(nil 1)");
}
