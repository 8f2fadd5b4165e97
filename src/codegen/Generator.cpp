//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Dispatches a typed program to the emitter of the requested target.
//
//===----------------------------------------------------------------------===//

#include "codegen/Generator.hpp"

#include "codegen/js/JsEmitter.hpp"
#include "frontends/lioncode/DiagCodes.hpp"

namespace lion::codegen
{

lion::support::Expected<std::string> generate(const lion::frontends::lioncode::Program &program,
                                              std::string_view target)
{
    using lion::frontends::lioncode::diag_codes::kUnsupportedTarget;

    if (target.empty())
        return lion::support::makeError({}, "Output type required", kUnsupportedTarget);
    if (target != "js")
    {
        return lion::support::makeError(
            {}, "Unknown output type: " + std::string(target), kUnsupportedTarget);
    }

    js::JsEmitter emitter;
    return emitter.emit(program);
}

} // namespace lion::codegen
