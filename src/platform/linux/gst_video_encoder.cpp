// Copyright 2026 The reelcore Authors
// Linux video encoder: GStreamer appsrc -> x264enc -> fragmented mp4.

#include "core/video_encoder.h"

#include <atomic>
#include <chrono>
#include <cstring>
#include <mutex>
#include <sstream>
#include <string>

#include "core/logger.h"

#include <gst/gst.h>
#include <gst/app/gstappsrc.h>

namespace reelcore {
namespace internal {

namespace {

// Fragmented mp4 keeps everything up to the last fragment playable when the
// trailer is never written, which is what an abandoned finish leaves behind.
std::string BuildPipelineDescription(int width, int height, int fps,
                                     int bitrate) {
  std::ostringstream desc;
  desc << "appsrc name=src is-live=true format=time do-timestamp=false"
       << " ! video/x-raw,format=BGRA,width=" << width
       << ",height=" << height << ",framerate=" << fps << "/1"
       << " ! videoconvert"
       << " ! x264enc tune=zerolatency speed-preset=ultrafast"
       << " bitrate=" << (bitrate / 1000)
       << " key-int-max=" << (fps * 2)
       << " ! h264parse"
       << " ! mp4mux fragment-duration=1000"
       << " ! filesink name=out";
  return desc.str();
}

// Blocks until EOS or an error reaches the bus.  No timeout: the Finalizer
// runs Finish() on its own thread and bounds the wait there.
bool WaitForEos(GstElement* pipeline) {
  GstBus* bus = gst_element_get_bus(pipeline);
  if (!bus) return false;
  GstMessage* msg = gst_bus_timed_pop_filtered(
      bus, GST_CLOCK_TIME_NONE,
      static_cast<GstMessageType>(GST_MESSAGE_EOS | GST_MESSAGE_ERROR));
  gst_object_unref(bus);
  if (!msg) return false;

  bool eos = GST_MESSAGE_TYPE(msg) == GST_MESSAGE_EOS;
  if (!eos) {
    GError* err = nullptr;
    gchar* debug = nullptr;
    gst_message_parse_error(msg, &err, &debug);
    REELCORE_LOG_ERROR("Encoder pipeline error: {} ({})",
                       err ? err->message : "unknown",
                       debug ? debug : "no details");
    if (err) g_error_free(err);
    g_free(debug);
  }
  gst_message_unref(msg);
  return eos;
}

}  // namespace

class GstVideoEncoder : public VideoEncoder {
 public:
  GstVideoEncoder() = default;
  ~GstVideoEncoder() override { Teardown(); }

  bool Open(const EncoderConfig& config) override {
    if (pipeline_) {
      REELCORE_LOG_WARN("Encoder already open");
      return false;
    }
    if (config.width < 2 || config.height < 2 || config.fps <= 0 ||
        config.output_path.empty()) {
      REELCORE_LOG_ERROR("Invalid encoder config {}x{} @ {} fps", config.width,
                         config.height, config.fps);
      return false;
    }

    gst_init(nullptr, nullptr);

    // 4:2:0 chroma needs even dimensions.
    width_ = config.width & ~1;
    height_ = config.height & ~1;
    frame_duration_ = GST_SECOND / static_cast<GstClockTime>(config.fps);

    std::string desc =
        BuildPipelineDescription(width_, height_, config.fps, config.bitrate);
    GError* error = nullptr;
    pipeline_ = gst_parse_launch(desc.c_str(), &error);
    if (error) {
      REELCORE_LOG_ERROR("Cannot build encoder pipeline: {}", error->message);
      g_error_free(error);
      Teardown();
      return false;
    }
    if (!pipeline_) return false;

    GstElement* out = gst_bin_get_by_name(GST_BIN(pipeline_), "out");
    appsrc_ = gst_bin_get_by_name(GST_BIN(pipeline_), "src");
    if (!out || !appsrc_) {
      REELCORE_LOG_ERROR("Encoder pipeline is missing its source or sink");
      if (out) gst_object_unref(out);
      Teardown();
      return false;
    }
    g_object_set(G_OBJECT(out), "location", config.output_path.c_str(),
                 nullptr);
    gst_object_unref(out);

    if (gst_element_set_state(pipeline_, GST_STATE_PLAYING) ==
        GST_STATE_CHANGE_FAILURE) {
      REELCORE_LOG_ERROR("Encoder pipeline refused to start for {}",
                         config.output_path);
      Teardown();
      return false;
    }

    frames_ = 0;
    have_origin_ = false;
    last_pts_ = 0;
    REELCORE_LOG_INFO("Encoder writing {} ({}x{} @ {} fps, {} bps)",
                      config.output_path, width_, height_, config.fps,
                      config.bitrate);
    return true;
  }

  bool SendFrame(const VideoFrame& frame) override {
    if (!appsrc_ || finished_.load()) return false;
    std::lock_guard<std::mutex> lock(mutex_);

    if (frame.width() < width_ || frame.height() < height_) {
      REELCORE_LOG_ERROR("Frame {}x{} is smaller than the encoder's {}x{}",
                         frame.width(), frame.height(), width_, height_);
      return false;
    }

    GstBuffer* buffer = CopyToBuffer(frame);
    if (!buffer) return false;
    GST_BUFFER_PTS(buffer) = PresentationTime(frame);
    GST_BUFFER_DURATION(buffer) = frame_duration_;

    // appsrc takes the buffer in every case.
    GstFlowReturn flow = gst_app_src_push_buffer(GST_APP_SRC(appsrc_), buffer);
    if (flow != GST_FLOW_OK) {
      REELCORE_LOG_ERROR("Encoder rejected frame {}: {}", frames_,
                         gst_flow_get_name(flow));
      return false;
    }
    ++frames_;
    return true;
  }

  bool Finish() override {
    if (!appsrc_ || finished_.exchange(true)) return false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      gst_app_src_end_of_stream(GST_APP_SRC(appsrc_));
    }
    bool ok = WaitForEos(pipeline_);
    gst_element_set_state(pipeline_, GST_STATE_NULL);
    REELCORE_LOG_INFO("Encoder closed after {} frames ({})", frames_,
                      ok ? "clean" : "failed");
    return ok;
  }

 private:
  // Rows are cropped to the encoder width; the frame may be wider or padded.
  GstBuffer* CopyToBuffer(const VideoFrame& frame) const {
    const size_t row_bytes =
        static_cast<size_t>(width_) * VideoFrame::kBytesPerPixel;
    GstBuffer* buffer =
        gst_buffer_new_allocate(nullptr, row_bytes * height_, nullptr);
    if (!buffer) return nullptr;

    GstMapInfo map;
    if (!gst_buffer_map(buffer, &map, GST_MAP_WRITE)) {
      gst_buffer_unref(buffer);
      return nullptr;
    }
    for (int row = 0; row < height_; ++row) {
      std::memcpy(map.data + row * row_bytes,
                  frame.data() + static_cast<size_t>(row) * frame.stride(),
                  row_bytes);
    }
    gst_buffer_unmap(buffer, &map);
    return buffer;
  }

  // Timestamps follow capture time from the first frame so dropped or late
  // frames do not compress the timeline.  Strictly increasing for the muxer.
  GstClockTime PresentationTime(const VideoFrame& frame) {
    if (!have_origin_) {
      origin_ = frame.captured_at();
      have_origin_ = true;
      last_pts_ = 0;
      return 0;
    }
    auto since = std::chrono::duration_cast<std::chrono::nanoseconds>(
        frame.captured_at() - origin_);
    GstClockTime pts =
        since.count() > 0 ? static_cast<GstClockTime>(since.count()) : 0;
    if (pts <= last_pts_) pts = last_pts_ + 1;
    last_pts_ = pts;
    return pts;
  }

  void Teardown() {
    if (appsrc_) {
      gst_object_unref(appsrc_);
      appsrc_ = nullptr;
    }
    if (pipeline_) {
      gst_element_set_state(pipeline_, GST_STATE_NULL);
      gst_object_unref(pipeline_);
      pipeline_ = nullptr;
    }
  }

  GstElement* pipeline_ = nullptr;
  GstElement* appsrc_ = nullptr;

  int width_ = 0;
  int height_ = 0;
  GstClockTime frame_duration_ = 0;

  std::mutex mutex_;  // Serializes SendFrame against EOS.
  int64_t frames_ = 0;
  bool have_origin_ = false;
  VideoFrame::Clock::time_point origin_;
  GstClockTime last_pts_ = 0;
  std::atomic<bool> finished_{false};
};

std::unique_ptr<VideoEncoder> CreatePlatformEncoder() {
  return std::make_unique<GstVideoEncoder>();
}

}  // namespace internal
}  // namespace reelcore
