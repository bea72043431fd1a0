#include "OutputParser.hpp"
#include "StringUtils.hpp"
#include <cstring>

OutputCommand OutputParser::parse_line(const std::string& line) {
    OutputCommand cmd;

    if (line.compare(0, std::strlen(SET_OUTPUT), SET_OUTPUT) == 0) {
        std::string body = line.substr(std::strlen(SET_OUTPUT));
        size_t eq = body.find('=');
        if (eq == std::string::npos) return cmd;

        std::string name = body.substr(0, eq);
        if (!StringUtils::is_key_identifier(name)) return cmd;

        cmd.kind = OutputCommand::Kind::SetOutput;
        cmd.name = name;
        cmd.value = body.substr(eq + 1);
        return cmd;
    }

    if (line.compare(0, std::strlen(ADD_MASK), ADD_MASK) == 0) {
        std::string value = line.substr(std::strlen(ADD_MASK));
        if (value.empty()) return cmd;
        cmd.kind = OutputCommand::Kind::AddMask;
        cmd.value = value;
        return cmd;
    }

    return cmd;
}
