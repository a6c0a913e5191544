#ifndef SAMPLE_SINK_HPP
#define SAMPLE_SINK_HPP

#include "stylus_report.hpp"

#include <memory>
#include <string>
#include <vector>

class SampleSink {
public:
    virtual ~SampleSink() = default;

    virtual std::string describe() const = 0;
    // false means the sink is unusable and the session has to be rebuilt.
    virtual bool forward(const StylusSample& sample) = 0;
    virtual void close() = 0;
};

// The sinks of one serving session, in registration order.
class SinkRegistry {
public:
    SinkRegistry() = default;
    ~SinkRegistry();

    SinkRegistry(const SinkRegistry&) = delete;
    SinkRegistry& operator=(const SinkRegistry&) = delete;

    void add(std::unique_ptr<SampleSink> sink);
    bool empty() const { return sinks.empty(); }
    size_t size() const { return sinks.size(); }

    // Every sink sees the sample even when an earlier one fails.
    bool forward_all(const StylusSample& sample);

    // Closes in reverse registration order and drops the sinks.
    void close_all();

private:
    std::vector<std::unique_ptr<SampleSink>> sinks;
};

#endif // SAMPLE_SINK_HPP
