/**
 * @file test_configure_main_render_target.cpp
 * @brief ConfigureMainRenderTargetEvent 单元测试
 *
 * 覆盖：宽高原样透传（含 0 与负数）；depth 恒开启；stencil 默认关闭、
 * EnableStencil 幂等且不可回退；链式调用返回同一对象。
 */

#include <tessel_client/configure_main_render_target_event.hpp>

#include <cstdlib>
#include <iostream>

#define TEST_CHECK(cond)                                               \
    do {                                                               \
        if (!(cond)) {                                                 \
            std::cerr << "FAIL: " << __FILE__ << ":" << __LINE__        \
                      << " " << #cond << std::endl;                    \
            std::exit(1);                                              \
        }                                                              \
    } while (0)

using tessel::client::ConfigureMainRenderTargetEvent;

static void test_dimensions_pass_through() {
    const int sizes[][2] = {{1920, 1080}, {1, 1}, {0, 0}, {-5, 7}, {800, -600}};
    for (const auto& s : sizes) {
        ConfigureMainRenderTargetEvent e(s[0], s[1]);
        TEST_CHECK(e.Width() == s[0]);
        TEST_CHECK(e.Height() == s[1]);
    }
}

static void test_defaults() {
    ConfigureMainRenderTargetEvent e(640, 480);
    TEST_CHECK(e.UseDepth());
    TEST_CHECK(!e.UseStencil());
}

static void test_enable_stencil_idempotent() {
    ConfigureMainRenderTargetEvent e(640, 480);
    e.EnableStencil();
    TEST_CHECK(e.UseStencil());
    e.EnableStencil();
    e.EnableStencil();
    TEST_CHECK(e.UseStencil());
    TEST_CHECK(e.UseDepth());
    TEST_CHECK(e.Width() == 640 && e.Height() == 480);
}

static void test_enable_stencil_chaining() {
    ConfigureMainRenderTargetEvent e(320, 200);
    ConfigureMainRenderTargetEvent& ref = e.EnableStencil().EnableStencil();
    TEST_CHECK(&ref == &e);
    TEST_CHECK(ref.UseStencil());
}

static void test_copy_keeps_flags() {
    ConfigureMainRenderTargetEvent e(1280, 720);
    e.EnableStencil();
    ConfigureMainRenderTargetEvent copy = e;
    TEST_CHECK(copy.UseStencil());
    TEST_CHECK(copy.UseDepth());
    TEST_CHECK(copy.Width() == 1280 && copy.Height() == 720);
}

int main() {
    test_dimensions_pass_through();
    test_defaults();
    test_enable_stencil_idempotent();
    test_enable_stencil_chaining();
    test_copy_keeps_flags();
    std::cout << "All ConfigureMainRenderTargetEvent tests passed." << std::endl;
    return 0;
}
