#pragma once

/**
 * @file renderer.hpp
 * @brief Contract every output-format converter implements.
 */

#include <ast/nodes.hpp>
#include <io/output_target.hpp>
#include <export.hpp>
#include <functional>
#include <memory>
#include <sstream>
#include <string>

namespace Polydoc {

class POLYDOC_API Renderer {
public:
    virtual ~Renderer() = default;

    virtual void render(const Document& doc, OutputTarget& out) = 0;

    virtual std::string render_to_string(const Document& doc) {
        std::ostringstream ss(std::ios::binary);
        auto target = OutputTarget::to_stream(ss);
        render(doc, target);
        return ss.str();
    }
};

using RendererPtr = std::unique_ptr<Renderer>;
using RendererFactory = std::function<RendererPtr(const json& options)>;

} // namespace Polydoc
