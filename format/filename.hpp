#ifndef __SPARITH_FILENAME_HPP__
#define __SPARITH_FILENAME_HPP__

#include <string>

#include <boost/filesystem.hpp>

#include <math/sparse_operation.hpp>

// basic helper functions to manipulate file names
namespace sparith { namespace filename {

namespace fs = boost::filesystem;

const std::string default_output_directory = "sparse_matrix/sample_results";

inline std::string parent_path(const std::string& name) {
    return fs::path(name).parent_path().string();
}

// file name without directory nor last extension. A name made of
// leading dots and no other dot (".matrix") has no extension.
inline std::string stem(const std::string& name) {
    fs::path base = fs::path(name).filename();
    const std::string s = base.string();
    std::string::size_type first = s.find_first_not_of('.');
    if (first == std::string::npos || s.rfind('.') < first) return s;
    return base.stem().string();
}

// <stem(first)>_<op>_<stem(second)>_result.txt
inline std::string result_filename(const std::string& first,
                                   operation op,
                                   const std::string& second) {
    return stem(first) + '_' + operation_name(op) + '_' + stem(second) +
           "_result.txt";
}

inline std::string result_path(const std::string& directory,
                               const std::string& first,
                               operation op,
                               const std::string& second) {
    return (fs::path(directory) / result_filename(first, op, second)).string();
}

// create directory (and parents) if needed. Returns true if created.
inline bool ensure_directory(const std::string& directory) {
    if (directory.empty()) return false;
    return fs::create_directories(fs::path(directory));
}

} // filename
} // sparith

#endif
