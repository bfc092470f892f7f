#include <algorithm>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>

#include <format/filename.hpp>
#include <format/sparse_text.hpp>
#include <math/sparse_matrix.hpp>
#include <math/sparse_operation.hpp>
#include <misc/log_helper.hpp>
#include <misc/option_parse.hpp>
#include <misc/progress.hpp>
#include <misc/strings.hpp>

typedef sparith::lmatrix matrix_type;

std::string name_op, name_first, name_second, name_out, name_log;
std::string output_dir = sparith::filename::default_output_directory;
int verbose = 0;
bool timing = false;

std::string prompt(const std::string& question) {
    std::cout << question << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        throw std::runtime_error("unexpected end of input");
    }
    return sparith::trimmed(answer);
}

matrix_type load(const std::string& name, sparith::log::dual_ostream& lout) {
    sparith::timer t;
    matrix_type m = sparith::read_sparse_text<long>(name);
    t.stop();
    lout(1) << "loaded " << name << ": " << m.rows() << "x" << m.cols()
            << ", " << m.nnz() << " entries" << std::endl;
    if (timing) lout(0) << "reading " << name << ": " << t << std::endl;
    return m;
}

int main(int argc, const char* argv[]) {

    namespace xcl = sparith::command_line;

    xcl::option_traits
        positional_group(false, true, "Positional parameters"),
        optional_group(false, false, "Optional parameters");

    xcl::option_parser parser(argv[0],
        "Add, subtract or multiply two sparse integer matrices stored "
        "in text files. Missing operation or operands are prompted for.");

    try {
        parser.use_brackets(true);
        parser.add_value("operation", name_op,
                         "Operation: add, subtract or multiply",
                         positional_group);
        parser.add_value("first", name_first, "First matrix file",
                         positional_group);
        parser.add_value("second", name_second, "Second matrix file",
                         positional_group);
        parser.add_value("output-dir", output_dir, output_dir,
                         "Directory receiving the result file",
                         optional_group);
        parser.add_value("output,o", name_out,
                         "Result file (overrides the generated name)",
                         optional_group);
        parser.add_value("log", name_log, "Log file", optional_group);
        parser.add_value("verbose", verbose, verbose,
                         "Verbose level", optional_group);
        parser.add_flag("timing", timing, "Report computation times",
                        optional_group);
        if (!parser.parse(argc, argv)) return 0;
    }
    catch (std::exception& e) {
        std::cerr << "ERROR: " << argv[0] << " threw exception:\n"
                  << e.what() << "\n";
        return 1;
    }

    std::ofstream logfile;
    if (!name_log.empty()) {
        logfile.open(name_log.c_str(), std::ios::app);
        if (!logfile) {
            std::cerr << "unable to open log file " << name_log << '\n';
            return 1;
        }
    }
    sparith::log::dual_ostream lout(logfile, std::cout, verbose,
                                    name_log.empty() ? -1 : std::max(verbose, 1));

    try {
        if (name_op.empty())
            name_op = prompt("Enter the operation (add, subtract, multiply): ");
        if (name_first.empty())
            name_first = prompt("Enter the path for the first matrix file: ");
        if (name_second.empty())
            name_second = prompt("Enter the path for the second matrix file: ");

        matrix_type a = load(name_first, lout);
        matrix_type b = load(name_second, lout);

        sparith::operation op;
        try {
            op = sparith::parse_operation(name_op);
        }
        catch (sparith::invalid_operation& e) {
            lout(0) << e.what();
            auto guess = sparith::closest_word(e.name(), sparith::operation_names());
            if (guess.second <= 2) lout << " (did you mean " << guess.first << "?)";
            lout << std::endl;
            return 1;
        }

        sparith::timer t;
        matrix_type result = sparith::apply(op, a, b);
        t.stop();
        lout(1) << sparith::operation_name(op) << ": " << result.rows() << "x"
                << result.cols() << ", " << result.nnz() << " entries"
                << std::endl;
        if (timing) lout(0) << sparith::operation_name(op) << ": " << t << std::endl;

        std::string path = name_out;
        if (path.empty()) {
            sparith::filename::ensure_directory(output_dir);
            path = sparith::filename::result_path(output_dir, name_first, op,
                                                  name_second);
        }
        else {
            sparith::filename::ensure_directory(
                sparith::filename::parent_path(path));
        }
        sparith::write_sparse_text(path, result);
        lout(0) << "Result saved to " << path << std::endl;
    }
    catch (std::exception& e) {
        lout(0) << e.what() << std::endl;
        return 1;
    }

    return 0;
}
