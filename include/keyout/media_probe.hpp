/**
 * @file media_probe.hpp
 * @brief Asset metadata probing with libavformat
 *
 * @details Opens a media file, reads stream info and extracts:
 *
 *          - Width and height of the best video stream
 *
 *          - Duration (container first, stream as fallback)
 *
 *          - Frame rate from r_frame_rate
 *
 *          - Whether any audio stream is present
 *
 * @note Still images are opened through libavformat's image demuxers and
 *       report a single video stream.
 */

#ifndef KEYOUT_MEDIA_PROBE_HPP
#define KEYOUT_MEDIA_PROBE_HPP

#include <string>

#include "errors.hpp"
#include "types.hpp"

namespace keyout {

/**
 * @brief Probe a media file.
 * @param path File to open
 * @param kind Asset kind; video-only fields are left at 0 for images
 * @param meta Output metadata
 * @param err Probe error on failure
 */
bool probe_media(const std::string &path, AssetKind kind, AssetMetadata &meta,
                 Error &err);

} // namespace keyout

#endif // KEYOUT_MEDIA_PROBE_HPP
