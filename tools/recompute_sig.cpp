// recompute_sig.cpp
// Re-sign a hand-edited calculation history file
// Usage: recompute_sig <path/to/file.tcalc>
// If environment variable TOUCHCALC_SECRET is set, HMAC-SHA256 is used; otherwise plain SHA256 is used.

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include "calculation_history.hpp"

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        std::cerr << "Usage: recompute_sig <file.tcalc>\n";
        return 2;
    }
    std::string path = argv[1];
    // Bare file names are taken relative to the current directory, not history/
    if (path.find('/') == std::string::npos)
        path = "./" + path;

    std::ifstream in(path);
    if (!in.is_open())
    {
        std::cerr << "Failed to open " << path << " for reading\n";
        return 2;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    in.close();

    calculator::HistoryLog log;
    if (!log.from_json(ss.str()))
    {
        std::cerr << "Not a history file: " << log.get_error() << "\n";
        return 2;
    }

    // save() signs the document and replaces the file atomically
    if (!log.save(path))
    {
        std::cerr << "Failed to write " << path << ": " << log.get_error() << "\n";
        return 2;
    }

    std::cout << "Recomputed signature and updated: " << calculator::HistoryLog::resolve_path(path) << "\n";
    return 0;
}
