#pragma once

#include "audio/audio_types.hpp"
#include "audio/gain_envelope.hpp"
#include <memory>
#include <string>

namespace nle::audio {

/**
 * @brief One buffer playback request: a source node feeding its own gain node
 */
struct SourceRequest {
    std::shared_ptr<const AudioBuffer> buffer;
    Seconds when = 0.0;          ///< Context time at which output starts
    Seconds offset = 0.0;        ///< Position inside the buffer
    Seconds duration = 0.0;      ///< Length of buffer material to play
    GainEnvelope envelope;       ///< Per-clip gain automation (context time)
    std::string clip_id;         ///< Diagnostic tag
};

/**
 * @brief Output graph with its own clock
 *
 * Every source is routed through its gain node into a single master gain. The
 * clock advances independently of the editor; callers only read it.
 */
class AudioContext {
public:
    virtual ~AudioContext() = default;

    virtual Seconds current_time() const = 0;
    virtual uint32_t sample_rate() const = 0;
    virtual uint16_t channels() const = 0;

    /**
     * @brief Schedule a buffer source
     * @param id Receives the node handle on success
     */
    virtual AudioError start_source(SourceRequest request, NodeId& id) = 0;

    /**
     * @brief Stop and disconnect a node. Nodes that already ended report UnknownNode.
     */
    virtual AudioError stop_source(NodeId id) = 0;

    virtual void set_master_gain(float gain) = 0;
    virtual float master_gain() const = 0;

    virtual AudioError resume() = 0;
    // Stops every node and releases the output; the context cannot be reused
    virtual AudioError close() = 0;
    virtual bool is_closed() const = 0;

    // Nodes scheduled and not yet ended or stopped
    virtual size_t active_source_count() const = 0;
};

} // namespace nle::audio
