#ifndef __SPARITH_OPTION_PARSE_HPP__
#define __SPARITH_OPTION_PARSE_HPP__

// STL
#include <exception>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// Boost
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/tokenizer.hpp>

namespace sparith { namespace command_line {

namespace po = boost::program_options;

// Simple class to store general information about a group of options
class option_traits {
public:
    option_traits(bool required=false,
                  bool positional=false,
                  const std::string& group_name="")
        : _default_requirement(required),
          _default_positional(positional),
          _group_name(group_name) {}

    void required(bool required) { _default_requirement = required; }
    void positional(bool positional) { _default_positional = positional; }
    void group_name(const std::string& name) { _group_name = name; }

    bool required() const { return _default_requirement; }
    bool positional() const { return _default_positional; }
    bool has_group() const { return !_group_name.empty(); }
    const std::string& group_name() const { return _group_name; }

protected:
    bool         _default_requirement;
    bool         _default_positional;
    std::string  _group_name;
};

template<typename T>
inline std::string type_as_string(bool use_brackets=true) {
    return use_brackets ? "<arg>" : "arg";
}

#define SPARITH_COMMAND_LINE_TYPES_TO_SYMBOLS \
    X(int, int); \
    X(unsigned int, uint); \
    X(long, long); \
    X(double, double); \
    X(std::string, string);

#define X(type, typestr) \
    template<> \
    inline std::string type_as_string<type>(bool use_brackets) { \
        return use_brackets ? \
            std::string("<" #typestr ">") : std::string(#typestr); \
    }
SPARITH_COMMAND_LINE_TYPES_TO_SYMBOLS
#undef X

/** option_parser: General-purpose parser for command line
    options built on top of boost::program_options, with
    - simplified interface
    - option groups and positional parameters
    - POSIX formatted usage message
 */
class option_parser {
    // notational convenience
    typedef po::options_description          option_group;
    typedef boost::shared_ptr<option_group>  group_ptr;
    typedef std::string                      str_t;

public:
    const str_t default_group_title;

    option_parser(const str_t& program_name,
                  const str_t& synopsis,
                  const str_t& default_section_title="Default Options",
                  size_t line_length=po::options_description::m_default_line_length);

    bool use_brackets() const {
        return _use_brackets;
    }
    void use_brackets(bool use_it=true) {
        _use_brackets = use_it;
    }

    // Add a parameter (default: optional / non-positional)
    template<typename _Type>
    void add_value(const str_t& name, _Type& variable,
                   const str_t& description,
                   const option_traits& traits=option_traits(false),
                   const str_t& symbol="");

    // Add and initialize parameter (default: optional / non-positional)
    template<typename _Type, typename _CompatibleType = _Type>
    void add_value(const str_t& name, _Type& variable,
                   const _CompatibleType& value,
                   const str_t& description,
                   const option_traits& traits=option_traits(false),
                   const str_t& symbol="");

    // Add boolean flag (ALWAYS: optional / non-positional)
    void add_flag(const str_t& name, bool& variable,
                  const str_t& description,
                  const option_traits& traits=option_traits(false));

    // Parse command line options. Returns false if help was requested
    // (the help message is then written to std::cout). Throws
    // std::runtime_error with the usage message appended on invalid input.
    bool parse(int argc, const char* argv[]);

    // whether option was given on the command line (after parse)
    bool is_set(const str_t& name) const {
        return _vm.count(name) > 0 && !_vm[name].defaulted();
    }

    // Print selected aspects of the help message
    str_t print_self(bool with_synopsis=true,
                     bool with_usage=true,
                     bool with_options=true) const;

private:
    typedef po::positional_options_description positionals_type;

    std::vector<group_ptr>  _groups;
    std::map<str_t, size_t> _group_map;
    positionals_type        _positionals;
    po::variables_map       _vm;
    str_t                   _program_name;
    str_t                   _synopsis;
    str_t                   _flags_string;
    std::vector<str_t>      _options_string;
    std::vector<str_t>      _positionals_string;
    size_t                  _line_length;
    bool                    _use_brackets;

    // returns usage description with prescribed indentation, whereby
    // each line does not exceed _line_length-1 characters
    str_t usage(size_t initial_indent=0, size_t indent=0) const;

    // returns shortest valid name of an option (with optional dash)
    str_t short_form(const str_t& name, bool with_dash=false) const;

    template<typename _Type>
    str_t typed_parameter_string(const str_t& s) const {
        if (!s.empty()) return s;
        return type_as_string<_Type>(_use_brackets);
    }

    void add_flag_to_usage_string(const str_t& name);

    void add_option_to_usage_string(const str_t& name,
                                    const str_t& symbol,
                                    bool required=false,
                                    bool positional=false);

    // return option group associated with traits
    group_ptr get_group(const option_traits& traits);

    template<typename T>
    po::typed_value<T>*
    get_semantic(T& variable, bool required, const str_t& symbol) {
        po::typed_value<T>* v =
            po::value<T>(&variable)->value_name(symbol.c_str());
        if (required) v->required();
        return v;
    }

    // reflow a paragraph and apply prescribed indentation
    str_t reflow(const str_t& s, size_t init_indent=0,
                 size_t indent=0) const;
};

} // command_line
} // sparith

inline std::ostream& operator<<(std::ostream& oss,
                                const sparith::command_line::option_parser& parser) {
    oss << parser.print_self();
    return oss;
}

inline sparith::command_line::option_parser::
option_parser(const str_t& program_name,
              const str_t& synopsis,
              const str_t& default_section_title,
              size_t line_length)
    : default_group_title(default_section_title),
      _groups(), _positionals(), _synopsis(synopsis),
      _line_length(line_length), _use_brackets(true) {

    boost::filesystem::path p(program_name);
    _program_name = p.filename().string();

    // create a group for general options
    _groups.push_back(group_ptr(new option_group(default_group_title)));
    _groups.back()->add_options()("help,h", "Print this message");
    _group_map[default_group_title] = 0;
    _flags_string += "-h";
}

inline std::string sparith::command_line::option_parser::
print_self(bool with_synopsis, bool with_usage, bool with_options) const {
    std::ostringstream oss;
    if (with_synopsis)
        oss << reflow(_program_name + ": " + _synopsis) << "\n\n";
    if (with_usage)
        oss << usage() << "\n\n";
    if (with_options) {
        option_group selected_groups(_line_length);
        for (auto it = _groups.begin(); it!=_groups.end() ; ++it) {
            selected_groups.add(**it);
        }
        oss << selected_groups;
    }
    return oss.str();
}

inline std::string sparith::command_line::option_parser::
reflow(const str_t& str, size_t init_indent, size_t indent) const {
    typedef boost::char_separator<char>    separator_t;
    typedef boost::tokenizer<separator_t>  tokenizer_t;

    separator_t sep(" ");
    tokenizer_t tokens(str, sep);

    str_t indent_1, indent_2;
    indent_1.assign(init_indent, ' ');
    indent_2.assign(init_indent + indent, ' ');

    std::ostringstream oss;
    oss << indent_1;
    size_t line_length = init_indent;
    for (tokenizer_t::iterator it=tokens.begin() ; it!=tokens.end(); ++it) {
        if (it == tokens.begin()) {
            oss << *it;
            line_length += it->size();
        }
        else if (it->size() + line_length + 1 < _line_length) {
            oss << " " << *it;
            line_length += it->size() + 1;
        }
        else {
            oss << '\n' << indent_2 << *it;
            line_length = it->size() + indent_2.size();
        }
    }

    return oss.str();
}

// Display grammar for option <name> with value symbol <sym>:
//    * "[--<name> <sym>]" if optional, "--<name> <sym>" if required
//    * positional parameters are shown as "<sym>|--<name> <sym>"
inline std::string sparith::command_line::option_parser::
usage(size_t initial_indent, size_t indent) const {

    str_t indent_1, indent_2;
    indent_1.assign(initial_indent, ' ');
    indent_2.assign(initial_indent + indent, ' ');

    std::ostringstream oss;
    oss << indent_1 << _program_name << " [" << _flags_string << "]";
    size_t length = initial_indent + _program_name.size() +
                    _flags_string.size() + 3;
    std::vector<str_t> items(_options_string);
    items.insert(items.end(), _positionals_string.begin(),
                 _positionals_string.end());
    for (size_t i=0 ; i<items.size() ; ++i) {
        const str_t& item = items[i];
        if (item.size() + length + 1 < _line_length) {
            oss << " " << item;
            length += item.size() + 1;
        }
        else {
            oss << '\n' << indent_2 << item;
            length = item.size() + indent_2.size();
        }
    }
    return oss.str();
}

// "-<c>" if <c> is the one-character short name of the option,
// "--<name>" otherwise
inline std::string sparith::command_line::option_parser::
short_form(const str_t& name, bool with_dash) const {
    size_t n = name.find(',');
    if (n != str_t::npos) {
        return (with_dash ? "-" : "") + name.substr(n+1, 1);
    }
    else if (with_dash) {
        return "--" + name;
    }
    else {
        return name;
    }
}

inline void sparith::command_line::option_parser::
add_flag_to_usage_string(const str_t& name) {
    str_t s = short_form(name, false);
    if (s.size() == 1) _flags_string += s;
    else _options_string.push_back("[" + short_form(name, true) + "]");
}

inline void sparith::command_line::option_parser::
add_option_to_usage_string(const str_t& name,
                           const str_t& val_str,
                           bool required, bool positional) {
    str_t opt_str = short_form(name, true) + " " + val_str;
    str_t form_str;
    if (positional) form_str = val_str + "|" + opt_str;
    else form_str = opt_str;
    str_t usage_str;
    if (required) usage_str = form_str;
    else usage_str = "[" + form_str + "]";
    if (positional) _positionals_string.push_back(usage_str);
    else _options_string.push_back(usage_str);
}

inline sparith::command_line::option_parser::group_ptr
sparith::command_line::option_parser::
get_group(const option_traits& traits) {
    const str_t& name = traits.group_name();
    if (!name.empty()) {
        std::map<str_t, size_t>::const_iterator it;
        it = _group_map.find(name);
        if (it != _group_map.end()) {
            // fetch existing group
            return _groups[it->second];
        }
        else {
            // create new group
            _groups.push_back(group_ptr(new option_group(name)));
            _group_map[name] = _groups.size()-1;
            return _groups.back();
        }
    }
    else { // default group
        return _groups[0];
    }
}

template<typename _Type>
inline void sparith::command_line::option_parser::
add_value(const str_t& name, _Type& variable,
          const str_t& description,
          const option_traits& traits,
          const str_t& symbol) {

    const str_t s = typed_parameter_string<_Type>(symbol);
    get_group(traits)->add_options()(
        name.c_str(),
        get_semantic(variable, traits.required(), s),
        description.c_str()
    );
    add_option_to_usage_string(name, s, traits.required(),
                               traits.positional());
    if (traits.positional()) _positionals.add(name.c_str(), 1);
}

template<typename _Type, typename _CompatibleType>
inline void sparith::command_line::option_parser::
add_value(const str_t& name, _Type& variable,
          const _CompatibleType& value, const str_t& description,
          const option_traits& traits,
          const str_t& symbol) {

    _Type init_value = static_cast<_Type>(value);
    const str_t s = typed_parameter_string<_Type>(symbol);
    get_group(traits)->add_options()(
        name.c_str(),
        get_semantic(variable, traits.required(), s)->default_value(init_value),
        description.c_str()
    );
    add_option_to_usage_string(name, s, traits.required(),
                               traits.positional());
    if (traits.positional()) _positionals.add(name.c_str(), 1);
}

inline void sparith::command_line::option_parser::
add_flag(const str_t& name, bool& variable,
         const str_t& description,
         const option_traits& traits) {

    variable = false;
    get_group(traits)->add_options()(
        name.c_str(), po::bool_switch(&variable), description.c_str()
    );
    add_flag_to_usage_string(name);
}

inline bool sparith::command_line::
option_parser::parse(int argc, const char* argv[]) {
    // consolidate all option groups into a single overall group
    option_group all_options(_line_length);
    for (auto it = _groups.begin(); it!=_groups.end() ; ++it) {
        all_options.add(**it);
    }

    _vm.clear();
    try {
        po::store(
            po::command_line_parser(argc, argv).
            options(all_options).
            positional(_positionals).run(),
            _vm
        );

        if (_vm.count("help")) {
            std::cout << print_self() << '\n';
            return false;
        }
        po::notify(_vm);
    }
    catch(po::error& e) {
        std::ostringstream os;
        os << "ERROR while parsing command line options for "
           << _program_name << ":\n" << e.what() << "\n\n"
           << print_self(false, true, false);
        throw std::runtime_error(os.str());
    }
    return true;
}

#endif // __SPARITH_OPTION_PARSE_HPP__
