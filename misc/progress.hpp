#ifndef __SPARITH_PROGRESS_HPP__
#define __SPARITH_PROGRESS_HPP__

#include <chrono>
#include <ctime>
#include <iostream>
#include <sstream>
#include <string>

namespace sparith {

// duration given in milliseconds
inline std::string human_readable_duration(double _t) {
    using namespace std::chrono;
    using dms = duration< double, std::ratio<1, 1000> >;

    if (_t < 0.001) return std::string("0 ms.");
    dms t(_t);
    std::ostringstream os;
    size_t h = duration_cast<hours>(t).count();
    if (h>0) {
        os << h << " h. ";
        t -= duration_cast<milliseconds>(hours(h));
    }
    size_t m = duration_cast<minutes>(t).count();
    if (m>0) {
        os << m << " m. ";
        t -= duration_cast<milliseconds>(minutes(m));
    }
    size_t s = duration_cast<seconds>(t).count();
    if (s>0) {
        os << s << " s. ";
        t -= duration_cast<milliseconds>(seconds(s));
    }
    size_t ms = duration_cast<milliseconds>(t).count();
    if (ms>0) {
        os << ms << " ms. ";
    }
    std::string str=os.str();
    if (str.empty()) return std::string("0 ms.");
    return str.substr(0, str.size()-1);
}

// cpu and wall clock timer, times in milliseconds
class timer {
    typedef std::chrono::high_resolution_clock hr_clock_t;
    typedef hr_clock_t::time_point time_point_t;

    std::clock_t m_cpu_begin, m_cpu_end;
    time_point_t m_wall_begin, m_wall_end;
    bool m_stopped;

public:
    timer() : m_stopped(false) {
        start();
    }

    void start() {
        m_cpu_begin = std::clock();
        m_wall_begin = hr_clock_t::now();
        m_stopped = false;
    }

    void stop() {
        m_cpu_end = std::clock();
        m_wall_end = hr_clock_t::now();
        m_stopped = true;
    }

    double cpu_time() const {
        std::clock_t end = m_stopped ? m_cpu_end : std::clock();
        return 1000.*static_cast<double>(end-m_cpu_begin)/CLOCKS_PER_SEC;
    }

    double wall_time() const {
        time_point_t end = m_stopped ? m_wall_end : hr_clock_t::now();
        return std::chrono::duration<double, std::milli>(end-m_wall_begin).count();
    }
};

inline std::ostream& operator<<(std::ostream& os, const timer& t) {
    os << "wall time: " << human_readable_duration(t.wall_time())
       << ", cpu time: " << human_readable_duration(t.cpu_time());
    return os;
}

} // namespace sparith

#endif
