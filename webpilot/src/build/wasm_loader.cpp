#include "build/wasm_loader.hpp"

#include <sstream>

#include "io/fs_utils.hpp"

namespace fs = std::filesystem;

namespace webpilot::build {
namespace {

std::string jsStringLiteral(const std::string &value) {
    std::string out = "\"";
    for (char ch : value) {
        if (ch == '"' || ch == '\\') {
            out.push_back('\\');
        }
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

} // namespace

std::string renderWasmLoader(const std::string &wasmFileName) {
    std::ostringstream js;
    js << "\"use strict\";\n"
       << "const fs = require(\"fs\");\n"
       << "const path = require(\"path\");\n"
       << "\n"
       << "const bytes = fs.readFileSync(path.join(__dirname, " << jsStringLiteral(wasmFileName) << "));\n"
       << "const unresolved = new Proxy({}, {\n"
       << "    get: (_, name) => () => { throw new Error(\"unresolved import: \" + String(name)); }\n"
       << "});\n"
       << "const imports = new Proxy({}, { get: () => unresolved });\n"
       << "\n"
       << "WebAssembly.instantiate(bytes, imports).then(({ instance }) => {\n"
       << "    const main = instance.exports.main;\n"
       << "    const code = typeof main === \"function\" ? main(0, 0) : 0;\n"
       << "    process.exit(code | 0);\n"
       << "}).catch((error) => {\n"
       << "    console.error(error);\n"
       << "    process.exit(101);\n"
       << "});\n";
    return js.str();
}

WasmLoaderGenerator::WasmLoaderGenerator(const webpilot::Context &ctx) : ctx_(ctx) {}

std::vector<fs::path> WasmLoaderGenerator::process(const BuildConfiguration &config, const fs::path &artifact) {
    if (config.triplet != Triplet::WasmNative) {
        return {};
    }

    fs::path loader = artifact;
    loader.replace_extension(".js");
    if (!io::writeTextFile(loader, renderWasmLoader(artifact.filename().string()))) {
        ctx_.error("Failed to write loader: ", loader.string());
        return {};
    }
    return {loader};
}

} // namespace webpilot::build
