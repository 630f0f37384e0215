//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/source_loader.cpp
// Purpose: File I/O helpers shared by the compiler, artifact codec and CLI.
// Key invariants: See source_loader.hpp.
// Ownership/Lifetime: See source_loader.hpp.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#include "tools/common/source_loader.hpp"

#include <fstream>
#include <new>
#include <sstream>

namespace fusion::tools::common
{
namespace
{
support::Diag ioError(std::string msg)
{
    return support::makeError("IOError", {}, std::move(msg));
}
} // namespace

support::Expected<std::string> loadSourceFile(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return ioError("unable to open " + path);

    in.seekg(0, std::ios::end);
    const auto size = in.tellg();
    in.seekg(0, std::ios::beg);
    if (size < 0 || static_cast<std::size_t>(size) > kMaxSourceBytes)
        return ioError("file too large: " + path);

    try
    {
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
    catch (const std::bad_alloc &)
    {
        return ioError("out of memory reading " + path);
    }
}

support::Expected<void> writeTextFile(const std::string &path, std::string_view text)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        return ioError("unable to write " + path);
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!out)
        return ioError("failed writing " + path);
    return {};
}

} // namespace fusion::tools::common
