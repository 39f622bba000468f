#pragma once

#include <stdexcept>
#include <string>

namespace afqueue {

/**
 * @brief Base exception class for all afqueue errors
 *
 * All afqueue-specific exceptions derive from this class, making it easy
 * to catch all afqueue errors with a single catch block.
 */
class afqueue_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Audio device related errors
 *
 * Thrown when the output device cannot be initialised (no backend, device
 * not found, format rejected) or fails while playing. These are fatal for
 * a run.
 */
class device_error : public afqueue_error {
public:
    using afqueue_error::afqueue_error;
};

/**
 * @brief Decoder related errors
 *
 * Thrown when no decoder recognises a file, when a decoder fails to
 * initialise, or when the data turns out to be corrupt mid-stream.
 * The affected track is skipped.
 */
class decoder_error : public afqueue_error {
public:
    using afqueue_error::afqueue_error;
};

/**
 * @brief I/O related errors
 *
 * Thrown when a track path does not exist or cannot be read.
 */
class io_error : public afqueue_error {
public:
    using afqueue_error::afqueue_error;
};

/**
 * @brief Operation attempted in a state that does not allow it
 */
class state_error : public afqueue_error {
public:
    using afqueue_error::afqueue_error;
};

/**
 * @brief Invalid configuration or command line
 */
class config_error : public afqueue_error {
public:
    using afqueue_error::afqueue_error;
};

} // namespace afqueue
