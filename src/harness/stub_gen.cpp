#include "harness/stub_gen.hpp"

#include "log/log.hpp"

#include <cctype>
#include <fstream>
#include <sstream>

namespace fwtest::harness {

std::string provider_name(const fs::path& source) {
    std::string name = source.stem().string();
    if (!name.empty()) {
        name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
    }
    if (!name.ends_with("Tests")) {
        name += "Tests";
    }
    return name;
}

std::string generate_provider_stub(const std::vector<fs::path>& sources) {
    std::ostringstream out;
    out << "// THIS IS AUTOGENERATED FILE\n";
    out << "// This method is invoked by the main routine to get a list of tests\n";
    out << "func registerProviders() {\n";
    for (const auto& source : sources) {
        out << "    " << provider_name(source) << "()\n";
    }
    out << "}\n";
    return out.str();
}

Result<bool, HarnessError> write_provider_stub(const fs::path& path, const std::string& content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return HarnessError::make(ErrorKind::IoError, "Cannot create directory " +
                                                              path.parent_path().string() + ": " +
                                                              ec.message());
        }
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return HarnessError::make(ErrorKind::IoError, "Cannot open " + path.string() + " for writing");
    }
    file << content;
    file.close();
    if (!file) {
        return HarnessError::make(ErrorKind::IoError, "Failed to write " + path.string());
    }

    FWTEST_LOG_DEBUG("stub", "Wrote " << path.string());
    return true;
}

} // namespace fwtest::harness
