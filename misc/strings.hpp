#ifndef __SPARITH_STRINGS_HPP__
#define __SPARITH_STRINGS_HPP__

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include <boost/algorithm/string.hpp>

namespace sparith {

    inline std::string& lower_case(std::string& str) {
        boost::algorithm::to_lower(str);
        return str;
    }

    inline std::string trimmed(const std::string& str) {
        return boost::algorithm::trim_copy(str);
    }

    // Empty tokens are kept: "1,,2" yields 3 words
    inline std::vector<std::string>
    split(const std::string& phrase, const std::string& delim=",") {
        std::vector<std::string> words;
        boost::algorithm::split(words, phrase,
                                boost::algorithm::is_any_of(delim));
        return words;
    }

    // non-blank lines of text, with surrounding whitespace removed
    inline std::vector<std::string> nonblank_lines(const std::string& text) {
        std::vector<std::string> lines;
        boost::algorithm::split(lines, text,
                                boost::algorithm::is_any_of("\n"));
        std::vector<std::string> r;
        for (auto& l : lines) {
            boost::algorithm::trim(l);
            if (!l.empty()) r.push_back(std::move(l));
        }
        return r;
    }

    // From "Fast, memory efficient Levenshtein algorithm"
    // by Sten Hjelmqvist found referenced on Wikipedia
    // https://en.wikipedia.org/wiki/Levenshtein_distance
    inline unsigned int
    levenshtein_distance(const std::string& s, const std::string& t) {
        if (s == t) return 0;
        if (s.size() == 0) return t.size();
        if (t.size() == 0) return s.size();

        // v0: previous row of distances, v1: current row
        std::vector<unsigned int> v0(t.size()+1), v1(t.size()+1);
        for (unsigned int i=0; i<v0.size(); ++i) v0[i]=i;

        for (unsigned int i=0; i<s.size(); ++i) {
            v1[0]=i+1;
            for (unsigned int j=0; j<t.size(); ++j) {
                unsigned int incr=(s[i]==t[j]) ? 0: 1;
                v1[j+1]=std::min(std::min(v1[j]+1, v0[j+1]+1), v0[j]+incr);
            }
            std::swap(v0, v1);
        }
        return v0[t.size()];
    }

    // closest candidate to arg (case-insensitive) and its distance
    inline std::pair<std::string, unsigned int>
    closest_word(std::string arg, const std::vector<std::string>& candidates) {
        lower_case(arg);
        std::pair<std::string, unsigned int> best("", static_cast<unsigned int>(-1));
        for (std::string c : candidates) {
            unsigned int d = levenshtein_distance(arg, lower_case(c));
            if (d < best.second) best = std::make_pair(c, d);
        }
        return best;
    }
} // sparith

#endif
