#pragma once

#include <functional>
#include <memory>
#include <string>

#include "common/specs.h"
#include "common/types.h"

namespace Lockstep {

/**
 * External helper (optimizer, numeric engine adapter) reachable through a
 * single call surface.
 */
class ITool {
public:
    virtual ~ITool() = default;

    virtual const std::string& Name() const = 0;
    virtual AttributeMap Call(const AttributeMap& args) = 0;
};

using ToolFactory = std::function<std::shared_ptr<ITool>(const ToolSpec& spec)>;

} // namespace Lockstep
