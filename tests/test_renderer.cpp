/**
 * @file test_renderer.cpp
 * @brief Tests for the Velocity-style template renderer
 */

#include <gtest/gtest.h>
#include "stagehand/Renderer.hpp"
#include "stagehand/Errors.hpp"
#include "test_support.hpp"

using namespace stagehand;

namespace {

const Properties kContext{
    {"host", "db.local"},
    {"port", "5432"},
    {"db.name", "orders"}
};

} // anonymous namespace

TEST(VelocityRenderer, BracedAndShorthandReferences) {
    VelocityRenderer renderer;
    EXPECT_EQ(renderer.render("url=${host}:$port", kContext), "url=db.local:5432");
}

TEST(VelocityRenderer, DottedReferenceUsesLongestDefinedKey) {
    VelocityRenderer renderer;
    EXPECT_EQ(renderer.render("name=$db.name", kContext), "name=orders");
    EXPECT_EQ(renderer.render("name=${db.name}", kContext), "name=orders");
    // "port" is defined, "port.suffix" is not
    EXPECT_EQ(renderer.render("$port.suffix", kContext), "5432.suffix");
}

TEST(VelocityRenderer, UnresolvedReferencesStayVerbatim) {
    VelocityRenderer renderer;
    EXPECT_EQ(renderer.render("a=${missing} b=$missing", kContext), "a=${missing} b=$missing");
}

TEST(VelocityRenderer, QuietReferencesRenderEmpty) {
    VelocityRenderer renderer;
    EXPECT_EQ(renderer.render("a=$!{missing}|b=$!missing|c=$!{host}", kContext), "a=|b=|c=db.local");
}

TEST(VelocityRenderer, EscapedDollar) {
    VelocityRenderer renderer;
    EXPECT_EQ(renderer.render("price=\\$host", kContext), "price=$host");
}

TEST(VelocityRenderer, PlainDollarsPassThrough) {
    VelocityRenderer renderer;
    EXPECT_EQ(renderer.render("cost $5 and $", kContext), "cost $5 and $");
    EXPECT_EQ(renderer.render("open ${host", kContext), "open ${host");
}

TEST(VelocityRenderer, StrictModeThrowsOnUnresolved) {
    VelocityRenderer renderer(true);
    EXPECT_EQ(renderer.render("${host}", kContext), "db.local");
    try {
        renderer.render("x=${missing}", kContext, "app.properties");
        FAIL() << "expected RenderError";
    } catch (const RenderError& e) {
        EXPECT_EQ(e.reference(), "missing");
        EXPECT_EQ(e.file(), "app.properties");
    }
    EXPECT_EQ(renderer.render("$!{missing}", kContext), "");
}

TEST(VelocityRenderer, RenderDirectoryMirrorsTree) {
    TempDir dir;
    dir.create_file("in/app.properties", "host=${host}\n");
    dir.create_file("in/nested/db.properties", "db=$db.name\n");

    VelocityRenderer renderer;
    auto written = renderer.render_directory(kContext, dir / "in", dir / "out");

    ASSERT_EQ(written.size(), 2u);
    EXPECT_EQ(slurp(dir / "out/app.properties"), "host=db.local\n");
    EXPECT_EQ(slurp(dir / "out/nested/db.properties"), "db=orders\n");
}
