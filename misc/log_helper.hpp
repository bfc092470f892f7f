#ifndef __SPARITH_MISC_LOG_HELPER_HPP__
#define __SPARITH_MISC_LOG_HELPER_HPP__

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace sparith { namespace log {

// Stream writing each message to a console stream and to a log file,
// each with its own priority threshold. A message of priority p is
// started with operator()(p) and flushed by std::endl:
//     log(1, "load: ") << "nnz=" << m.nnz() << std::endl;
// It reaches the console if p <= console threshold and the file if
// p <= file threshold.
class dual_ostream {
public:
    typedef dual_ostream self_t;

    dual_ostream(std::ostream& file, std::ostream& os=std::cout,
                 int os_thresh=0, int file_thresh=1)
        : m_file(file), m_os(os), m_os_thresh(os_thresh),
          m_file_thresh(file_thresh), m_priority(1000), m_active(false) {
        m_max_prio = std::max(os_thresh, file_thresh);
    }

    void set_thresholds(int os_thresh, int file_thresh) {
        m_os_thresh = os_thresh;
        m_file_thresh = file_thresh;
        m_max_prio = std::max(os_thresh, file_thresh);
        m_active = false;
    }

    int console_threshold() const { return m_os_thresh; }
    int file_threshold() const { return m_file_thresh; }

    self_t& operator()(int p=0, const std::string& pre="") {
        m_priority = p;
        reset();
        if (p > m_max_prio) {
            m_active = false;
            return *this;
        }
        m_active = true;
        if (p <= m_os_thresh) m_stream << pre;
        if (p <= m_file_thresh) m_filestream << pre;
        return *this;
    }

    self_t& operator<<(std::ios_base& (*func)(std::ios_base&)) {
        if (!m_active) return *this;
        if (m_priority <= m_os_thresh) func(m_stream);
        if (m_priority <= m_file_thresh) func(m_filestream);
        return *this;
    }

    // std::endl, std::flush: terminate the current message
    self_t& operator<<(std::ostream& (*func)(std::ostream&)) {
        if (!m_active) return *this;
        if (m_priority <= m_os_thresh) {
            func(m_stream);
            m_os << m_stream.str() << std::flush;
        }
        if (m_priority <= m_file_thresh) {
            func(m_filestream);
            m_file << m_filestream.str() << std::flush;
        }
        m_active = false;
        reset();
        return *this;
    }

    template< typename T >
    friend self_t& operator<<(self_t&, const T&);

private:
    std::ostream& m_file;
    std::ostream& m_os;
    int m_os_thresh;
    int m_file_thresh;
    int m_max_prio;
    int m_priority;
    bool m_active;

    std::ostringstream m_stream;
    std::ostringstream m_filestream;

    // each message starts with empty buffers and default formatting
    static void reset(std::ostringstream& s) {
        s.str("");
        s.clear();
        s.flags(std::ios_base::dec | std::ios_base::skipws);
        s.precision(6);
        s.width(0);
        s.fill(' ');
    }

    void reset() {
        reset(m_stream);
        reset(m_filestream);
    }
};

template< typename T >
dual_ostream& operator<<(dual_ostream& os, const T& t) {
    if (!os.m_active) return os;
    if (os.m_priority <= os.m_os_thresh) os.m_stream << t;
    if (os.m_priority <= os.m_file_thresh) os.m_filestream << t;
    return os;
}

} // log
} // sparith

#endif
