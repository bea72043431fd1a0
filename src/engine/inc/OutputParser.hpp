#pragma once

#include <string>

// Workflow commands recognised in step output, one per line:
//   ::set-output::<name>=<value>     name is [A-Za-z_][A-Za-z0-9_-]*
//   ::add-mask::<value>
// Any other line, including malformed commands, is plain output.
struct OutputCommand {
    enum class Kind {
        None,
        SetOutput,
        AddMask
    };

    Kind kind = Kind::None;
    std::string name;
    std::string value;
};

class OutputParser {
public:
    static constexpr const char* SET_OUTPUT = "::set-output::";
    static constexpr const char* ADD_MASK = "::add-mask::";

    static OutputCommand parse_line(const std::string& line);
};
