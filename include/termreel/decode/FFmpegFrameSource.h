// Repository: TermReel
// Component: FFmpeg Frame Source
// Purpose: Video decoding to RGB24 frames using libavformat/libavcodec/libswscale.
// Copyright (c) 2025 TermReel

#ifndef TERMREEL_DECODE_FFMPEG_FRAME_SOURCE_H_
#define TERMREEL_DECODE_FFMPEG_FRAME_SOURCE_H_

#include <cstdint>
#include <string>

#include "termreel/decode/IFrameSource.hpp"

// Forward declarations for FFmpeg types (avoids pulling in FFmpeg headers here)
struct AVFormatContext;
struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwsContext;

namespace termreel::decode {

// FrameSourceConfig holds configuration for FFmpeg-based decoding.
struct FrameSourceConfig {
  std::string input_uri;        // File path or URI to decode
  int max_decode_threads;       // Maximum decoder threads (0 = auto)

  FrameSourceConfig() : max_decode_threads(0) {}
};

// DecoderStats tracks decoding counters.
struct DecoderStats {
  uint64_t frames_decoded;
  uint64_t frames_discarded;    // Preroll frames dropped while seeking
  uint64_t decode_errors;

  DecoderStats() : frames_decoded(0), frames_discarded(0), decode_errors(0) {}
};

// FFmpegFrameSource decodes the first video stream of a file and converts
// every frame to RGB24 at the stream's native size.
//
// Thread Safety:
// - Not thread-safe: owned by the render loop.
//
// Lifecycle:
// 1. Construct with config
// 2. Call Open() to initialize decoder
// 3. Call Read() repeatedly; SeekToFrame() to reposition
// 4. Call Close() or rely on destructor
//
// Error Handling:
// - Returns false on errors with stats updated and a log line emitted
class FFmpegFrameSource : public IFrameSource {
 public:
  explicit FFmpegFrameSource(const FrameSourceConfig& config);
  ~FFmpegFrameSource() override;

  // Disable copy and move
  FFmpegFrameSource(const FFmpegFrameSource&) = delete;
  FFmpegFrameSource& operator=(const FFmpegFrameSource&) = delete;

  bool Open() override;
  void Close() override;
  bool IsOpen() const override { return format_ctx_ != nullptr; }

  bool Read(buffer::Frame& output_frame) override;

  // Seeks to the keyframe at or before the target, then decodes and
  // discards until the target frame is reached. The target frame is kept
  // pending for the next Read().
  bool SeekToFrame(int64_t frame_index) override;

  int Width() const override;
  int Height() const override;
  int64_t FrameCount() const override;
  double Fps() const override;
  int64_t Position() const override { return position_; }
  const std::string& Path() const override { return config_.input_uri; }

  bool IsEOF() const { return eof_reached_; }
  const DecoderStats& GetStats() const { return stats_; }

 private:
  bool FindVideoStream();
  bool InitializeCodec();

  // Pulls the next decoded picture into frame_. False at EOF or on error.
  bool DecodeNextPicture();

  // Converts frame_ to RGB24.
  bool ConvertFrame(buffer::Frame& output_frame);

  // Presentation timestamp of frame_ in stream time base.
  int64_t PictureTimestamp() const;

  // Stream timestamp for a frame index.
  int64_t FrameIndexToTimestamp(int64_t frame_index) const;

  FrameSourceConfig config_;
  DecoderStats stats_;

  // FFmpeg contexts (opaque pointers)
  AVFormatContext* format_ctx_ = nullptr;
  AVCodecContext* codec_ctx_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVPacket* packet_ = nullptr;
  SwsContext* sws_ctx_ = nullptr;

  int video_stream_index_ = -1;
  bool demux_eof_reached_ = false;
  bool eof_reached_ = false;

  // Picture left in frame_ by SeekToFrame() preroll
  bool has_pending_picture_ = false;

  int64_t start_time_ = 0;
  int64_t position_ = 0;
};

// Factory used by the player engine: constructs, opens, and returns nullptr
// when the path cannot be opened.
FrameSourceFactory MakeFFmpegFrameSourceFactory(int max_decode_threads = 0);

}  // namespace termreel::decode

#endif  // TERMREEL_DECODE_FFMPEG_FRAME_SOURCE_H_
