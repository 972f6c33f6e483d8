// RenderTypeTable 单元测试：内置类型、Define 去重、Find/GetName、无效键

#include <tessel_render/render_type.hpp>

#include <cstdlib>
#include <iostream>
#include <unordered_set>

#define TEST_CHECK(cond)                                               \
    do {                                                               \
        if (!(cond)) {                                                 \
            std::cerr << "FAIL: " << __FILE__ << ":" << __LINE__        \
                      << " " << #cond << std::endl;                    \
            std::exit(1);                                              \
        }                                                              \
    } while (0)

using tessel::render::RenderTypeKey;
using tessel::render::RenderTypeTable;
namespace RenderTypes = tessel::render::RenderTypes;

static void test_builtins() {
    RenderTypeTable table;
    TEST_CHECK(table.Size() == 5u);
    TEST_CHECK(table.GetName(RenderTypes::Solid) == "solid");
    TEST_CHECK(table.GetName(RenderTypes::CutoutMipped) == "cutout_mipped");
    TEST_CHECK(table.GetName(RenderTypes::Cutout) == "cutout");
    TEST_CHECK(table.GetName(RenderTypes::Translucent) == "translucent");
    TEST_CHECK(table.GetName(RenderTypes::Tripwire) == "tripwire");
    TEST_CHECK(*table.Find("translucent") == RenderTypes::Translucent);
}

static void test_define() {
    RenderTypeTable table;
    RenderTypeKey a = table.Define("mymod:glow");
    TEST_CHECK(a.IsValid());
    TEST_CHECK(a != RenderTypes::Tripwire);
    TEST_CHECK(table.Define("mymod:glow") == a);
    TEST_CHECK(table.Size() == 6u);
    RenderTypeKey b = table.Define("mymod:portal");
    TEST_CHECK(b != a);
    TEST_CHECK(table.GetName(b) == "mymod:portal");
    TEST_CHECK(table.Define("solid") == RenderTypes::Solid);
}

static void test_unknown() {
    RenderTypeTable table;
    TEST_CHECK(!table.Find("missing").has_value());
    TEST_CHECK(table.GetName(tessel::render::kInvalidRenderType).empty());
    TEST_CHECK(table.GetName(RenderTypeKey{1000}).empty());
    TEST_CHECK(!tessel::render::kInvalidRenderType.IsValid());
}

static void test_hashable() {
    std::unordered_set<RenderTypeKey> keys;
    keys.insert(RenderTypes::Solid);
    keys.insert(RenderTypes::Solid);
    keys.insert(RenderTypes::Cutout);
    TEST_CHECK(keys.size() == 2u);
}

int main() {
    test_builtins();
    test_define();
    test_unknown();
    test_hashable();
    std::cout << "All RenderTypeTable tests passed." << std::endl;
    return 0;
}
