#include "aux.hh"

#include <cctype>
#include <climits>
#include <istream>
#include <sstream>

namespace RnaSS {
    failure::~failure() noexcept {}

    const char *
    failure::what() const noexcept {
        return msg_.c_str();
    }

    // ------------------------------------------------------------

    std::string
    trim(const std::string &s) {
        const std::string whitespace = " \t\r\n";
        const size_t strBegin = s.find_first_not_of(whitespace);
        if (strBegin == std::string::npos)
            return "";
        const size_t strEnd = s.find_last_not_of(whitespace);
        return s.substr(strBegin, strEnd - strBegin + 1);
    }

    std::vector<std::string>
    split_at_whitespace(const std::string &s) {
        std::vector<std::string> v;
        std::istringstream in(s);
        std::string token;
        while (in >> token) {
            v.push_back(token);
        }
        return v;
    }

    bool
    has_prefix(const std::string &s, const std::string &p, size_t start) {
        if (s.length() < p.length() + start) {
            return false;
        }
        return s.substr(start, p.length()) == p;
    }

    bool
    parse_index(const std::string &s, long &x) {
        if (s.empty())
            return false;
        long value = 0;
        for (char c : s) {
            if (!isdigit(static_cast<unsigned char>(c)))
                return false;
            if (value > (LONG_MAX - (c - '0')) / 10)
                return false;
            value = value * 10 + (c - '0');
        }
        x = value;
        return true;
    }

    bool
    get_nonempty_line(std::istream &in, std::string &line) {
        const std::string whitespace = " \t\r";
        while (getline(in, line)) {
            const size_t strEnd = line.find_last_not_of(whitespace);
            if (strEnd != std::string::npos) {
                // remove trailing white space
                line = line.substr(0, strEnd + 1);
                return true;
            }
        }
        line = "";
        return false;
    }
}
