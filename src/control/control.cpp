#include "debpack/control.hpp"
#include "debpack/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace debpack {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

void replace_all(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

// Format a long description: " text" per line, " ." for blank lines
std::string format_description(const std::string& description) {
    std::istringstream in(description);
    std::string line;
    std::string out;
    bool first = true;
    while (std::getline(in, line)) {
        if (first) {
            out = trim(line);
            first = false;
            continue;
        }
        out += "\n";
        std::string t = trim(line);
        out += t.empty() ? " ." : " " + t;
    }
    return out;
}

} // namespace

// ============================================================================
// ControlDescriptor
// ============================================================================

std::optional<std::string> ControlDescriptor::get(const std::string& name) const {
    for (const auto& f : fields) {
        if (iequals(f.name, name)) {
            return f.value;
        }
    }
    return std::nullopt;
}

void ControlDescriptor::set(const std::string& name, const std::string& value) {
    for (auto& f : fields) {
        if (iequals(f.name, name)) {
            f.value = value;
            return;
        }
    }
    fields.push_back({name, value});
}

std::string ControlDescriptor::render() const {
    std::string out;
    for (const auto& f : fields) {
        out += f.name + ": " + f.value + "\n";
    }
    return out;
}

ControlParseResult parse_control(const std::string& content) {
    ControlParseResult result;

    std::istringstream in(content);
    std::string line;
    size_t line_no = 0;
    bool in_paragraph = false;

    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (trim(line).empty()) {
            if (in_paragraph) {
                // Anything after the first paragraph must also be blank
                while (std::getline(in, line)) {
                    ++line_no;
                    if (!trim(line).empty()) {
                        result.error = "line " + std::to_string(line_no) +
                                       ": binary control file must contain a single paragraph";
                        return result;
                    }
                }
            }
            continue;
        }

        if (line[0] == '#') {
            continue;
        }

        if (line[0] == ' ' || line[0] == '\t') {
            if (result.descriptor.fields.empty()) {
                result.error = "line " + std::to_string(line_no) +
                               ": continuation line before any field";
                return result;
            }
            result.descriptor.fields.back().value += "\n" + line;
            continue;
        }

        auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            result.error = "line " + std::to_string(line_no) + ": expected 'Field: value'";
            return result;
        }

        std::string name = line.substr(0, colon);
        if (name.find(' ') != std::string::npos) {
            result.error = "line " + std::to_string(line_no) + ": invalid field name '" +
                           name + "'";
            return result;
        }
        if (result.descriptor.get(name)) {
            result.error = "line " + std::to_string(line_no) + ": duplicate field '" +
                           name + "'";
            return result;
        }

        result.descriptor.fields.push_back({name, trim(line.substr(colon + 1))});
        in_paragraph = true;
    }

    if (result.descriptor.fields.empty()) {
        result.error = "control file is empty";
        return result;
    }

    result.ok = true;
    return result;
}

const std::vector<std::string>& required_control_fields() {
    static const std::vector<std::string> fields = {
        "Package", "Version", "Architecture", "Maintainer", "Description",
    };
    return fields;
}

std::string render_control_template(const std::string& content,
                                    const PackageMetadata& metadata) {
    std::string out = content;
    replace_all(out, "${name}", metadata.name);
    replace_all(out, "${version}", metadata.version);
    replace_all(out, "${architecture}", metadata.architecture);
    return out;
}

// ============================================================================
// Control Generation
// ============================================================================

ControlDescriptor generate_control(const PackageMetadata& metadata,
                                   const ControlFields& fields,
                                   std::uint64_t installed_size_kib) {
    ControlDescriptor control;
    control.set("Package", metadata.name);
    control.set("Version", metadata.version);
    control.set("Architecture", metadata.architecture);
    control.set("Maintainer", trim(fields.maintainer));
    if (installed_size_kib > 0) {
        control.set("Installed-Size", std::to_string(installed_size_kib));
    }
    if (!trim(fields.section).empty()) {
        control.set("Section", trim(fields.section));
    }
    if (!trim(fields.priority).empty()) {
        control.set("Priority", trim(fields.priority));
    }
    if (!trim(fields.homepage).empty()) {
        control.set("Homepage", trim(fields.homepage));
    }
    control.set("Description", format_description(fields.description));
    return control;
}

StageResult validate_control(const ControlDescriptor& control,
                             const PackageMetadata& metadata) {
    for (const auto& name : required_control_fields()) {
        auto value = control.get(name);
        if (!value || trim(*value).empty()) {
            return StageResult::failure(BuildError::InvalidControl,
                                        "control file missing required field: " + name);
        }
    }

    struct Expect {
        const char* field;
        const std::string& value;
    };
    const Expect identity[] = {
        {"Package", metadata.name},
        {"Version", metadata.version},
        {"Architecture", metadata.architecture},
    };

    for (const auto& e : identity) {
        std::string actual = trim(*control.get(e.field));
        if (actual != e.value) {
            return StageResult::failure(
                BuildError::InvalidControl,
                std::string("control field ") + e.field + " is '" + actual +
                    "' but the resolved metadata says '" + e.value + "'");
        }
    }

    return StageResult::success();
}

ControlPrepareResult prepare_control(const ControlSource& source,
                                     const PackageMetadata& metadata,
                                     std::uint64_t installed_size_kib) {
    ControlPrepareResult result;
    result.error_code = BuildError::InvalidControl;

    if (source.path.empty()) {
        if (trim(source.fields.maintainer).empty() || trim(source.fields.description).empty()) {
            result.error = "no control file configured and maintainer/description not set";
            return result;
        }
        result.content = generate_control(metadata, source.fields, installed_size_kib).render();
        result.generated = true;
    } else {
        auto content = read_file(source.path);
        if (!content) {
            result.error = "cannot read control file: " + source.path;
            return result;
        }
        if (content->find("${") != std::string::npos) {
            result.content = render_control_template(*content, metadata);
            spdlog::debug("rendered control template {}", source.path);
        } else {
            result.content = *content;
        }
    }

    auto parsed = parse_control(result.content);
    if (!parsed.ok) {
        result.error = (source.path.empty() ? std::string("generated control") : source.path) +
                       ": " + parsed.error;
        return result;
    }

    auto valid = validate_control(parsed.descriptor, metadata);
    if (!valid.ok) {
        result.error = valid.error;
        return result;
    }

    result.error_code = BuildError::None;
    result.ok = true;
    return result;
}

} // namespace debpack
