//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements argument parsing and the compile action of `lionc`.
//
//===----------------------------------------------------------------------===//

#include "tools/lionc/cli.hpp"

#include "frontends/lioncode/Compiler.hpp"
#include "support/source_manager.hpp"
#include "tools/common/source_loader.hpp"

#include <fstream>

namespace lion::tools::lionc
{

namespace
{
lion::support::Diagnostic usageError(std::string message)
{
    return lion::support::Diagnostic{lion::support::Severity::Error, std::move(message), {}, {}};
}
} // namespace

lion::support::Expected<LioncConfig> parseArgs(int argc, char **argv)
{
    LioncConfig config{};

    for (int i = 0; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help")
        {
            config.showHelp = true;
        }
        else if (arg == "--version")
        {
            config.showVersion = true;
        }
        else if (arg == "-o")
        {
            if (i + 1 >= argc)
                return usageError("missing file name after -o");
            config.outputPath = argv[++i];
        }
        else if (arg == "--target")
        {
            if (i + 1 >= argc)
                return usageError("missing target name after --target");
            config.compiler.target = argv[++i];
        }
        else if (arg.rfind("--target=", 0) == 0)
        {
            config.compiler.target = arg.substr(9);
        }
        else if (arg == "-O0")
        {
            config.compiler.optimize = false;
        }
        else if (arg == "-O1")
        {
            config.compiler.optimize = true;
        }
        else if (arg == "--dump-ast")
        {
            config.compiler.dumpAst = true;
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            return usageError("unknown flag: " + arg);
        }
        else if (!config.sourcePath.empty())
        {
            return usageError("multiple source files: " + config.sourcePath + " and " + arg);
        }
        else
        {
            config.sourcePath = arg;
        }
    }

    if (config.showHelp || config.showVersion)
        return config;

    if (config.sourcePath.empty())
        return usageError("no source file specified");

    return config;
}

void printUsage(std::ostream &os)
{
    os << "Usage: lionc <file.lion> [-o <out.js>] [--target js] [-O0] [--dump-ast]\n"
       << "\n"
       << "Options:\n"
       << "  -o FILE        Write the generated code to FILE instead of stdout\n"
       << "  --target NAME  Output target (only 'js' is supported)\n"
       << "  -O0            Disable the AST optimizer\n"
       << "  --dump-ast     Print the AST to stderr after analysis and optimization\n"
       << "  -h, --help     Show this message\n"
       << "  --version      Show the version\n";
}

int runLionc(const LioncConfig &config, std::ostream &out, std::ostream &err)
{
    lion::support::SourceManager sm;

    auto loaded = lion::tools::common::loadSourceBuffer(config.sourcePath, sm);
    if (!loaded)
    {
        lion::support::printDiag(loaded.error(), err, &sm);
        return 1;
    }

    lion::frontends::lioncode::CompilerInput input;
    input.source = loaded.value().buffer;
    input.path = config.sourcePath;
    input.fileId = loaded.value().fileId;

    auto result = lion::frontends::lioncode::compile(input, config.compiler, sm);
    if (!result.succeeded())
    {
        result.diagnostics.printAll(err, &sm);
        return 1;
    }

    if (config.outputPath.empty())
    {
        out << result.output << '\n';
        return 0;
    }

    std::ofstream file(config.outputPath, std::ios::binary);
    if (!file)
    {
        err << "error: unable to open " << config.outputPath << " for writing\n";
        return 1;
    }
    file << result.output << '\n';
    if (!file)
    {
        err << "error: failed writing " << config.outputPath << '\n';
        return 1;
    }
    return 0;
}

} // namespace lion::tools::lionc
