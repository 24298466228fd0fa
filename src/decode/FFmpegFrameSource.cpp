// Repository: TermReel
// Component: FFmpeg Frame Source
// Purpose: Video decoding to RGB24 frames using libavformat/libavcodec/libswscale.
// Copyright (c) 2025 TermReel

#include "termreel/decode/FFmpegFrameSource.h"

#include <cmath>
#include <sstream>

#include "termreel/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/log.h>  // For av_log_set_level
#include <libavutil/mathematics.h>
#include <libswscale/swscale.h>
}

namespace termreel::decode {

using termreel::util::Logger;

namespace {

std::string AvError(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return std::string(errbuf);
}

}  // namespace

FFmpegFrameSource::FFmpegFrameSource(const FrameSourceConfig& config)
    : config_(config) {}

FFmpegFrameSource::~FFmpegFrameSource() {
  Close();
}

bool FFmpegFrameSource::Open() {
  if (IsOpen()) {
    return true;
  }
  Logger::Debug("[FFmpegFrameSource] Opening: " + config_.input_uri);

  // Suppress FFmpeg warnings but keep errors visible
  av_log_set_level(AV_LOG_ERROR);

  // Open input file (open_input)
  int ret = avformat_open_input(&format_ctx_, config_.input_uri.c_str(), nullptr, nullptr);
  if (ret < 0) {
    std::ostringstream oss;
    oss << "[FFmpegFrameSource] DECODER_STEP open_input FAILED uri=" << config_.input_uri
        << " ret=" << ret << " err=" << AvError(ret);
    Logger::Warn(oss.str());
    format_ctx_ = nullptr;
    return false;
  }

  // Retrieve stream information (avformat_find_stream_info)
  ret = avformat_find_stream_info(format_ctx_, nullptr);
  if (ret < 0) {
    std::ostringstream oss;
    oss << "[FFmpegFrameSource] DECODER_STEP avformat_find_stream_info FAILED uri="
        << config_.input_uri << " ret=" << ret << " err=" << AvError(ret);
    Logger::Warn(oss.str());
    Close();
    return false;
  }

  if (!FindVideoStream()) {
    Logger::Warn("[FFmpegFrameSource] DECODER_STEP find_video_stream FAILED uri=" +
                 config_.input_uri + " (no video stream)");
    Close();
    return false;
  }

  if (!InitializeCodec()) {
    Logger::Warn("[FFmpegFrameSource] DECODER_STEP initialize_codec FAILED uri=" +
                 config_.input_uri);
    Close();
    return false;
  }

  packet_ = av_packet_alloc();
  if (!packet_) {
    Logger::Error("[FFmpegFrameSource] DECODER_STEP packet_alloc FAILED uri=" +
                  config_.input_uri);
    Close();
    return false;
  }

  position_ = 0;

  std::ostringstream oss;
  oss << "[FFmpegFrameSource] DECODER_STEP open_input OK uri=" << config_.input_uri
      << " " << Width() << "x" << Height() << " @ " << Fps() << " fps"
      << " frames=" << FrameCount();
  Logger::Info(oss.str());
  return true;
}

void FFmpegFrameSource::Close() {
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }

  if (frame_) {
    av_frame_free(&frame_);
  }

  if (packet_) {
    av_packet_free(&packet_);
  }

  if (codec_ctx_) {
    avcodec_free_context(&codec_ctx_);
  }

  if (format_ctx_) {
    avformat_close_input(&format_ctx_);
  }

  video_stream_index_ = -1;
  demux_eof_reached_ = false;
  eof_reached_ = false;
  has_pending_picture_ = false;
  position_ = 0;
}

bool FFmpegFrameSource::Read(buffer::Frame& output_frame) {
  if (!IsOpen()) {
    return false;
  }

  if (has_pending_picture_) {
    has_pending_picture_ = false;
  } else if (!DecodeNextPicture()) {
    return false;
  }

  if (!ConvertFrame(output_frame)) {
    return false;
  }
  output_frame.metadata.frame_index = position_;
  output_frame.metadata.duration = 1.0 / Fps();
  ++position_;
  return true;
}

bool FFmpegFrameSource::SeekToFrame(int64_t frame_index) {
  if (!IsOpen()) {
    return false;
  }
  if (frame_index < 0) {
    frame_index = 0;
  }

  const int64_t target_ts = FrameIndexToTimestamp(frame_index);

  // Seek to keyframe before the target position (seek)
  int ret = av_seek_frame(format_ctx_, video_stream_index_, target_ts,
                          AVSEEK_FLAG_BACKWARD);
  if (ret < 0) {
    std::ostringstream oss;
    oss << "[FFmpegFrameSource] DECODER_STEP seek FAILED uri=" << config_.input_uri
        << " frame=" << frame_index << " ret=" << ret << " err=" << AvError(ret);
    Logger::Warn(oss.str());
    return false;
  }

  avcodec_flush_buffers(codec_ctx_);
  demux_eof_reached_ = false;
  eof_reached_ = false;
  has_pending_picture_ = false;

  // Preroll: decode and discard until the on-target picture.
  while (DecodeNextPicture()) {
    const int64_t ts = PictureTimestamp();
    if (ts == AV_NOPTS_VALUE || ts >= target_ts) {
      has_pending_picture_ = true;
      position_ = frame_index;
      return true;
    }
    stats_.frames_discarded++;
  }

  // Target lies beyond the last decodable picture.
  position_ = frame_index;
  return eof_reached_;
}

int FFmpegFrameSource::Width() const {
  if (!codec_ctx_) return 0;
  return codec_ctx_->width;
}

int FFmpegFrameSource::Height() const {
  if (!codec_ctx_) return 0;
  return codec_ctx_->height;
}

double FFmpegFrameSource::Fps() const {
  if (!format_ctx_ || video_stream_index_ < 0) return kFallbackFps;

  AVStream* stream = format_ctx_->streams[video_stream_index_];
  // r_frame_rate is the container/codec nominal rate; avg_frame_rate is the
  // fallback for streams that leave it unset.
  AVRational fps = stream->r_frame_rate;
  if (fps.num <= 0 || fps.den <= 0) {
    fps = stream->avg_frame_rate;
  }
  if (fps.num <= 0 || fps.den <= 0) return kFallbackFps;
  return av_q2d(fps);
}

int64_t FFmpegFrameSource::FrameCount() const {
  if (!format_ctx_ || video_stream_index_ < 0) return 0;

  AVStream* stream = format_ctx_->streams[video_stream_index_];
  if (stream->nb_frames > 0) {
    return stream->nb_frames;
  }
  if (format_ctx_->duration != AV_NOPTS_VALUE && format_ctx_->duration > 0) {
    const double seconds = static_cast<double>(format_ctx_->duration) / AV_TIME_BASE;
    return static_cast<int64_t>(std::llround(seconds * Fps()));
  }
  return 0;
}

bool FFmpegFrameSource::FindVideoStream() {
  int index = av_find_best_stream(format_ctx_, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (index < 0) {
    return false;
  }
  video_stream_index_ = index;
  AVStream* stream = format_ctx_->streams[index];
  start_time_ = stream->start_time != AV_NOPTS_VALUE ? stream->start_time : 0;
  return true;
}

bool FFmpegFrameSource::InitializeCodec() {
  AVStream* stream = format_ctx_->streams[video_stream_index_];
  AVCodecParameters* codecpar = stream->codecpar;

  const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
  if (!codec) {
    std::ostringstream oss;
    oss << "[FFmpegFrameSource] Codec not found: " << codecpar->codec_id;
    Logger::Warn(oss.str());
    return false;
  }

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    Logger::Error("[FFmpegFrameSource] Failed to allocate codec context");
    return false;
  }

  if (avcodec_parameters_to_context(codec_ctx_, codecpar) < 0) {
    Logger::Error("[FFmpegFrameSource] Failed to copy codec parameters");
    return false;
  }

  if (config_.max_decode_threads > 0) {
    codec_ctx_->thread_count = config_.max_decode_threads;
  }
  codec_ctx_->thread_type = FF_THREAD_FRAME;

  if (avcodec_open2(codec_ctx_, codec, nullptr) < 0) {
    Logger::Warn("[FFmpegFrameSource] Failed to open codec");
    return false;
  }

  frame_ = av_frame_alloc();
  if (!frame_) {
    Logger::Error("[FFmpegFrameSource] Failed to allocate frame");
    return false;
  }
  return true;
}

bool FFmpegFrameSource::DecodeNextPicture() {
  if (eof_reached_) {
    return false;
  }

  while (true) {
    int ret = avcodec_receive_frame(codec_ctx_, frame_);
    if (ret == 0) {
      stats_.frames_decoded++;
      return true;
    }
    if (ret == AVERROR_EOF) {
      eof_reached_ = true;
      return false;
    }
    if (ret != AVERROR(EAGAIN)) {
      stats_.decode_errors++;
      Logger::Warn("[FFmpegFrameSource] receive_frame FAILED uri=" + config_.input_uri +
                   " err=" + AvError(ret));
      return false;
    }

    // Decoder needs input.
    if (demux_eof_reached_) {
      eof_reached_ = true;
      return false;
    }

    ret = av_read_frame(format_ctx_, packet_);
    if (ret == AVERROR_EOF) {
      // Drain the decoder's delayed pictures.
      demux_eof_reached_ = true;
      avcodec_send_packet(codec_ctx_, nullptr);
      continue;
    }
    if (ret < 0) {
      stats_.decode_errors++;
      Logger::Warn("[FFmpegFrameSource] read_frame FAILED uri=" + config_.input_uri +
                   " err=" + AvError(ret));
      return false;
    }

    if (packet_->stream_index != video_stream_index_) {
      av_packet_unref(packet_);
      continue;
    }

    ret = avcodec_send_packet(codec_ctx_, packet_);
    av_packet_unref(packet_);
    if (ret < 0 && ret != AVERROR(EAGAIN)) {
      // Corrupt packet: count it and keep going with the next one.
      stats_.decode_errors++;
    }
  }
}

bool FFmpegFrameSource::ConvertFrame(buffer::Frame& output_frame) {
  const int width = frame_->width;
  const int height = frame_->height;

  sws_ctx_ = sws_getCachedContext(
      sws_ctx_,
      width, height, static_cast<AVPixelFormat>(frame_->format),
      width, height, AV_PIX_FMT_RGB24,
      SWS_BILINEAR, nullptr, nullptr, nullptr);
  if (!sws_ctx_) {
    Logger::Error("[FFmpegFrameSource] Failed to create scaler context");
    return false;
  }

  output_frame.width = width;
  output_frame.height = height;
  output_frame.data.assign(buffer::Frame::Size(width, height), 0);

  uint8_t* dst_data[4] = {output_frame.data.data(), nullptr, nullptr, nullptr};
  int dst_linesize[4] = {width * 3, 0, 0, 0};
  sws_scale(sws_ctx_, frame_->data, frame_->linesize, 0, height, dst_data, dst_linesize);
  return true;
}

int64_t FFmpegFrameSource::PictureTimestamp() const {
  return frame_->best_effort_timestamp != AV_NOPTS_VALUE ? frame_->best_effort_timestamp
                                                         : frame_->pts;
}

int64_t FFmpegFrameSource::FrameIndexToTimestamp(int64_t frame_index) const {
  AVStream* stream = format_ctx_->streams[video_stream_index_];
  AVRational fps = stream->r_frame_rate;
  if (fps.num <= 0 || fps.den <= 0) {
    fps = AVRational{static_cast<int>(kFallbackFps), 1};
  }
  // frame_index frames of duration 1/fps, expressed in the stream time base.
  return start_time_ + av_rescale_q(frame_index, av_inv_q(fps), stream->time_base);
}

FrameSourceFactory MakeFFmpegFrameSourceFactory(int max_decode_threads) {
  return [max_decode_threads](const std::string& path) -> std::unique_ptr<IFrameSource> {
    FrameSourceConfig config;
    config.input_uri = path;
    config.max_decode_threads = max_decode_threads;
    auto source = std::make_unique<FFmpegFrameSource>(config);
    if (!source->Open()) {
      return nullptr;
    }
    return source;
  };
}

}  // namespace termreel::decode
