#ifndef CODEFLOW_COMMON_TEMPLATE_RENDERER_H
#define CODEFLOW_COMMON_TEMPLATE_RENDERER_H

#include <inja/inja.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <filesystem> // Required by Inja for set_include_callback

namespace codeflow {

class InjaTemplateRenderer {
public:
    InjaTemplateRenderer();

    // 静态方法：使用默认环境渲染模板
    static std::string render(std::string_view template_str, const nlohmann::json& data);

    std::string render_with_env(std::string_view template_str, const nlohmann::json& data);

private:
    inja::Environment env_;
    void configure_security(); // include 被禁用
};

} // namespace codeflow

#endif // CODEFLOW_COMMON_TEMPLATE_RENDERER_H
