/**
 * @file Renderer.hpp
 * @brief Template rendering against a target context
 */

#ifndef STAGEHAND_RENDERER_HPP
#define STAGEHAND_RENDERER_HPP

#include "stagehand/Properties.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace stagehand {

/**
 * @brief Renders a directory of templates with a variable binding
 */
class TemplateRenderer {
public:
    virtual ~TemplateRenderer() = default;

    /**
     * @brief Render every file below source_dir into the mirrored path below dest_dir
     * @return The files written
     */
    virtual std::vector<std::filesystem::path> render_directory(
        const Properties& context,
        const std::filesystem::path& source_dir,
        const std::filesystem::path& dest_dir) = 0;
};

/**
 * @brief Velocity-style reference substitution
 *
 * References:
 * - `${key}` and `$key` (dotted keys resolve to the longest defined prefix)
 * - `$!{key}` and `$!key` render empty when undefined
 * - `\$` is a literal dollar
 *
 * Undefined references are left verbatim unless the renderer is strict,
 * in which case they throw RenderError.
 */
class VelocityRenderer : public TemplateRenderer {
public:
    explicit VelocityRenderer(bool strict = false) : strict_(strict) {}

    std::string render(const std::string& text,
                       const Properties& context,
                       const std::string& origin = "<string>") const;

    std::vector<std::filesystem::path> render_directory(
        const Properties& context,
        const std::filesystem::path& source_dir,
        const std::filesystem::path& dest_dir) override;

    bool strict() const noexcept { return strict_; }

private:
    bool strict_;
};

} // namespace stagehand

#endif // STAGEHAND_RENDERER_HPP
