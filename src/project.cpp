#include "cargomcp/project.hpp"

#include "cargomcp/config.hpp"
#include "cargomcp/errors.hpp"
#include "cargomcp/format.hpp"

#include <string>
#include <system_error>

using namespace cargomcp::literals;
namespace fs = std::filesystem;

namespace cargomcp {

    fs::path resolve_project_root(std::string_view path) {
        if (path.empty()) {
            throw tool_error{error_kind::invalid_project, "project path is empty"};
        }

        std::error_code ec{};
        auto root = fs::canonical(fs::path{path}, ec);
        if (ec) {
            throw tool_error{
                    error_kind::invalid_project, "cannot resolve project path '{}': {}"_format(path, ec.message())};
        }

        if (!fs::is_directory(root, ec)) {
            throw tool_error{error_kind::invalid_project, "'{}' is not a directory"_format(root.string())};
        }

        auto manifest = root / manifest_file_name;
        if (!fs::is_regular_file(manifest, ec)) {
            throw tool_error{
                    error_kind::invalid_project,
                    "no {} found in '{}'"_format(manifest_file_name, root.string())};
        }

        debug_log("project root: ", root.string());
        return root;
    }

}  // namespace cargomcp
