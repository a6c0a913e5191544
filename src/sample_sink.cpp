#include "sample_sink.hpp"
#include "log.hpp"

SinkRegistry::~SinkRegistry() {
    close_all();
}

void SinkRegistry::add(std::unique_ptr<SampleSink> sink) {
    if (sink) {
        sinks.push_back(std::move(sink));
    }
}

bool SinkRegistry::forward_all(const StylusSample& sample) {
    bool all_ok = true;
    for (auto& sink : sinks) {
        if (!sink->forward(sample)) {
            log_error() << "Sink " << sink->describe() << " failed";
            all_ok = false;
        }
    }
    return all_ok;
}

void SinkRegistry::close_all() {
    for (auto it = sinks.rbegin(); it != sinks.rend(); ++it) {
        log_debug() << "Closing " << (*it)->describe();
        (*it)->close();
    }
    sinks.clear();
}
