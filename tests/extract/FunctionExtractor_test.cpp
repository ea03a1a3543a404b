#include <gtest/gtest.h>
#include "extract/FunctionExtractor.hpp"
#include "core/SourceFile.hpp"
#include <algorithm>
#include <memory>

using namespace funcscan;

namespace {

SyntaxNode make_node(NodeKind kind, std::string name, uint32_t start, uint32_t end) {
    SyntaxNode node;
    node.kind = kind;
    node.name = std::move(name);
    node.start_line = start;
    node.end_line = end;
    return node;
}

// Hand-built tree standing in for a parser
class FunctionExtractorTest : public ::testing::Test {
protected:
    void SetUp() override {
        source = std::make_unique<SourceFile>(
            "def top(a):\n"               // 1
            "    def nested():\n"         // 2
            "        pass\n"              // 3
            "    return a\n"              // 4
            "class Shape:\n"              // 5
            "    async def area(self):\n" // 6
            "        return 0\n"          // 7
            "    class Meta:\n"           // 8
            "        def inner(self):\n"  // 9
            "            pass\n"          // 10
            "async def last():\n"         // 11
            "    pass\n");                // 12

        SyntaxNode top = make_node(NodeKind::FUNCTION_DEF, "top", 1, 4);
        top.children.push_back(make_node(NodeKind::FUNCTION_DEF, "nested", 2, 3));

        SyntaxNode meta = make_node(NodeKind::CLASS_DEF, "Meta", 8, 10);
        meta.children.push_back(make_node(NodeKind::FUNCTION_DEF, "inner", 9, 10));

        SyntaxNode shape = make_node(NodeKind::CLASS_DEF, "Shape", 5, 10);
        shape.children.push_back(make_node(NodeKind::ASYNC_FUNCTION_DEF, "area", 6, 7));
        shape.children.push_back(meta);

        root.kind = NodeKind::MODULE;
        root.children.push_back(top);
        root.children.push_back(shape);
        root.children.push_back(make_node(NodeKind::ASYNC_FUNCTION_DEF, "last", 11, 12));
    }

    std::unique_ptr<SourceFile> source;
    SyntaxNode root;
};

} // namespace

TEST_F(FunctionExtractorTest, SourceOrderAndQualifiedNames) {
    FunctionExtractor extractor(source->lines(), {"import os"}, "shapes");

    auto records = extractor.extract(root);

    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].name, "top");
    EXPECT_EQ(records[1].name, "Shape.area");
    EXPECT_EQ(records[2].name, "last");
}

TEST_F(FunctionExtractorTest, NestedDefinitionsAreSkipped) {
    FunctionExtractor extractor(source->lines(), {}, "shapes");

    auto records = extractor.extract(root);

    for (const auto& record : records) {
        EXPECT_NE(record.name, "nested");
        EXPECT_NE(record.name, "top.nested");
        EXPECT_NE(record.name, "Meta.inner");
        EXPECT_NE(record.name, "Shape.Meta.inner");
        EXPECT_LE(std::count(record.name.begin(), record.name.end(), '.'), 1);
    }
}

TEST_F(FunctionExtractorTest, SpansBodiesAndSignatures) {
    FunctionExtractor extractor(source->lines(), {}, "shapes");

    auto records = extractor.extract(root);
    ASSERT_EQ(records.size(), 3u);

    EXPECT_EQ(records[0].start_line, 1u);
    EXPECT_EQ(records[0].end_line, 4u);
    EXPECT_EQ(records[0].signature, "def top(a):");
    EXPECT_EQ(records[0].body, slice_lines(source->lines(), 1, 4));

    EXPECT_EQ(records[1].signature, "    async def area(self):");
    EXPECT_EQ(records[1].body, "    async def area(self):\n        return 0\n");
}

TEST_F(FunctionExtractorTest, SharedImportsAndModule) {
    std::vector<std::string> imports{"import os", "from  import x"};
    FunctionExtractor extractor(source->lines(), imports, "shapes");

    auto records = extractor.extract(root);

    for (const auto& record : records) {
        EXPECT_EQ(record.imports, imports);
        EXPECT_EQ(record.module, "shapes");
    }
}

TEST_F(FunctionExtractorTest, MissingEndLineFallsBackToStart) {
    SyntaxNode tree;
    tree.kind = NodeKind::MODULE;
    tree.children.push_back(make_node(NodeKind::FUNCTION_DEF, "last", 11, 0));

    FunctionExtractor extractor(source->lines(), {}, "shapes");
    auto records = extractor.extract(tree);

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].end_line, 11u);
    EXPECT_EQ(records[0].body, "async def last():\n");
}

TEST(FunctionExtractorEmptyTest, NoDefinitions) {
    SourceFile source("x = 1\n");
    SyntaxNode root;
    root.kind = NodeKind::MODULE;
    root.children.push_back(SyntaxNode{});

    FunctionExtractor extractor(source.lines(), {}, "m");

    EXPECT_TRUE(extractor.extract(root).empty());
}
