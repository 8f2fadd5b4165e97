//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/common/source_loader.cpp
// Purpose: Read source files into memory for the command-line tools.
// Key invariants: The loaded buffer contains the complete file contents.
// Ownership/Lifetime: The returned LoadedSource owns its buffer.
//
//===----------------------------------------------------------------------===//

#include "tools/common/source_loader.hpp"

#include <fstream>
#include <new>
#include <sstream>

namespace lion::tools::common
{

namespace
{
lion::support::Diagnostic ioError(std::string message)
{
    return lion::support::Diagnostic{lion::support::Severity::Error, std::move(message), {}, {}};
}
} // namespace

lion::support::Expected<LoadedSource> loadSourceBuffer(const std::string &path,
                                                       lion::support::SourceManager &sm)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return ioError("unable to open " + path);

    in.seekg(0, std::ios::end);
    auto fileSize = in.tellg();
    in.seekg(0, std::ios::beg);
    constexpr auto kMaxSourceSize = static_cast<std::streamoff>(64ULL * 1024 * 1024);
    if (fileSize < 0 || fileSize > kMaxSourceSize)
        return ioError("source file too large: " + path + " (limit: 64 MB)");

    std::string contents;
    try
    {
        std::ostringstream ss;
        ss << in.rdbuf();
        contents = ss.str();
    }
    catch (const std::bad_alloc &)
    {
        return ioError("out of memory reading " + path);
    }

    const uint32_t fileId = sm.addFile(path);
    if (fileId == 0)
        return ioError("source manager exhausted file identifiers");

    LoadedSource source{};
    source.buffer = std::move(contents);
    source.fileId = fileId;
    return source;
}

} // namespace lion::tools::common
