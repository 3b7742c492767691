#pragma once

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/mem.h>
}

#include <memory>
#include <string>

namespace scenedl::media {

// Simple RAII for AVPacket
struct AVPacketDeleter {
	void operator()(AVPacket *pkt) const {
		if (pkt) { av_packet_free(&pkt); }
	}
};

using AVPacketPtr = std::unique_ptr<AVPacket, AVPacketDeleter>;

inline AVPacketPtr make_packet() { return AVPacketPtr(av_packet_alloc()); }

struct AVFrameDeleter {
	void operator()(AVFrame *frame) const {
		if (frame) { av_frame_free(&frame); }
	}
};

using AVFramePtr = std::unique_ptr<AVFrame, AVFrameDeleter>;

struct AVCodecContextDeleter {
	void operator()(AVCodecContext *ctx) const {
		if (ctx) { avcodec_free_context(&ctx); }
	}
};

using AVCodecContextPtr = std::unique_ptr<AVCodecContext, AVCodecContextDeleter>;

inline std::string av_error_string(int err) {
	char buf[AV_ERROR_MAX_STRING_SIZE] = {};
	av_strerror(err, buf, sizeof(buf));
	return buf;
}

}  // namespace scenedl::media
