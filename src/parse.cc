#include "parse.h"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

#include "logging.h"

std::string to_dimacs(const Formula& f) {
    std::ostringstream oss;
    oss << "p cnf " << f.nvars << " " << f.clauses.size() << "\n";
    for (const Clause& c : f.clauses) {
        for (lit_t l : c) oss << l << " ";
        oss << "0\n";
    }
    return oss.str();
}

static std::string line_error(int lineno, const std::string& msg) {
    std::ostringstream oss;
    oss << "line " << lineno << ": " << msg;
    return oss.str();
}

// Parses token as a base-10 integer. Returns false on trailing garbage or
// overflow of long long.
static bool parse_int(const std::string& token, long long* out) {
    errno = 0;
    char* end = nullptr;
    long long v = strtoll(token.c_str(), &end, 10);
    if (token.empty() || *end != '\0' || errno == ERANGE) return false;
    *out = v;
    return true;
}

static bool parse_problem_line(const std::string& line, int lineno,
                               long long* nvars, long long* nclauses,
                               std::string* error) {
    std::istringstream ls(line);
    std::string p, fmt, nv, nc, extra;
    ls >> p >> fmt >> nv >> nc;
    if (p != "p" || fmt != "cnf" || nc.empty() || (ls >> extra)) {
        *error = line_error(lineno, "malformed problem line '" + line +
                            "', expected 'p cnf <nvars> <nclauses>'");
        return false;
    }
    if (!parse_int(nv, nvars) || !parse_int(nc, nclauses)) {
        *error = line_error(lineno, "non-integer count in problem line '" +
                            line + "'");
        return false;
    }
    if (*nvars < 0 || *nclauses < 0) {
        *error = line_error(lineno, "negative count in problem line");
        return false;
    }
    if (*nvars > std::numeric_limits<lit_t>::max() ||
        *nclauses > std::numeric_limits<clause_t>::max()) {
        *error = line_error(lineno, "count too large in problem line");
        return false;
    }
    return true;
}

bool parse_dimacs(const std::string& text, Formula* f, std::string* error) {
    std::istringstream in(text);
    std::string line;
    int lineno = 0;
    bool header = false;
    long long nvars = 0, nclauses = 0;
    Formula parsed;

    while (std::getline(in, line)) {
        ++lineno;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        std::size_t first = line.find_first_not_of(" \t\r\n\v\f");
        if (first == std::string::npos || line[first] == 'c') continue;

        if (line[first] == 'p') {
            if (header) {
                *error = line_error(lineno, "duplicate problem line");
                return false;
            }
            if (!parse_problem_line(line, lineno, &nvars, &nclauses, error)) {
                return false;
            }
            header = true;
            parsed.nvars = static_cast<lit_t>(nvars);
            LOG(4) << "Problem has " << nvars << " variables and "
                   << nclauses << " clauses.";
            continue;
        }

        if (!header) {
            *error = line_error(lineno, "clause before problem line");
            return false;
        }

        std::istringstream ls(line);
        std::string token;
        std::vector<long long> ints;
        while (ls >> token) {
            long long v;
            if (!parse_int(token, &v)) {
                *error = line_error(lineno, "'" + token +
                                    "' is not an integer literal");
                return false;
            }
            ints.push_back(v);
        }
        if (ints.empty()) continue;
        if (ints.back() != 0) {
            *error = line_error(lineno, "clause is not terminated by 0");
            return false;
        }
        Clause c;
        c.reserve(ints.size() - 1);
        for (std::size_t i = 0; i + 1 < ints.size(); ++i) {
            long long l = ints[i];
            if (l == 0) {
                *error = line_error(lineno, "literal 0 inside a clause");
                return false;
            }
            if (l > nvars || l < -nvars) {
                std::ostringstream oss;
                oss << "literal " << l << " out of range [1, " << nvars << "]";
                *error = line_error(lineno, oss.str());
                return false;
            }
            c.push_back(static_cast<lit_t>(l));
        }
        parsed.clauses.push_back(std::move(c));
    }

    if (!header) {
        *error = "missing problem line 'p cnf <nvars> <nclauses>'";
        return false;
    }
    if (static_cast<long long>(parsed.clauses.size()) != nclauses) {
        std::ostringstream oss;
        oss << "problem line declares " << nclauses << " clauses but "
            << parsed.clauses.size() << " were found";
        *error = oss.str();
        return false;
    }
    LOG(4) << "Done parsing input.";
    *f = std::move(parsed);
    return true;
}

bool read_dimacs(const char* filename, Formula* f, std::string* error) {
    std::ifstream in(filename);
    if (!in) {
        *error = std::string("Failed to open file: ") + filename;
        return false;
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    if (in.bad()) {
        *error = std::string("Failed to read file: ") + filename;
        return false;
    }
    return parse_dimacs(oss.str(), f, error);
}

void print_assignment(std::ostream& out, char tag, lit_t nvars,
                      const Assignment& a, bool fill) {
    std::size_t j = 0;
    auto emit = [&](lit_t v, bool val) {
        if (j % 10 == 0) out << tag;
        out << (val ? " " : " -") << v;
        ++j;
        if (j % 10 == 0) out << std::endl;
    };
    if (fill) {
        for (lit_t i = 1; i <= nvars; ++i) {
            auto itr = a.find(i);
            emit(i, itr != a.end() && itr->second);
        }
    } else {
        for (const auto& kv : a) emit(kv.first, kv.second);
    }
    if (j % 10 == 0) out << tag;
    out << " 0" << std::endl;
}
