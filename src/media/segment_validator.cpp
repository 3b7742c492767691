#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/scope_exit.hpp>
#include <cstring>
#include <fstream>
#include <iterator>
#include <scenedl/validator.hpp>
#include <vector>

#include "ffmpeg_utils.hpp"

namespace scenedl::media {

namespace {

constexpr int kIOBufferSize = 64 * 1024;

struct MemoryReader {
	const std::string *data;
	std::size_t offset = 0;
};

int read_memory(void *opaque, uint8_t *buf, int buf_size) {
	auto *reader = static_cast<MemoryReader *>(opaque);
	const auto left = reader->data->size() - reader->offset;
	if (left == 0) return AVERROR_EOF;
	const auto n = std::min(left, static_cast<std::size_t>(buf_size));
	std::memcpy(buf, reader->data->data() + reader->offset, n);
	reader->offset += n;
	return static_cast<int>(n);
}

int64_t seek_memory(void *opaque, int64_t offset, int whence) {
	auto *reader = static_cast<MemoryReader *>(opaque);
	const auto size = static_cast<int64_t>(reader->data->size());
	if (whence == AVSEEK_SIZE) return size;

	int64_t target = 0;
	switch (whence & ~AVSEEK_FORCE) {
		case SEEK_SET: target = offset; break;
		case SEEK_CUR:
			target = static_cast<int64_t>(reader->offset) + offset;
			break;
		case SEEK_END: target = size + offset; break;
		default: return AVERROR(EINVAL);
	}
	if (target < 0 || target > size) return AVERROR(EINVAL);
	reader->offset = static_cast<std::size_t>(target);
	return target;
}

Result<std::string> read_file(const std::filesystem::path &path) {
	std::ifstream in(path, std::ios::binary);
	if (!in) return outcome::failure(errc::file_open_failed);
	return std::string(std::istreambuf_iterator<char>(in),
					   std::istreambuf_iterator<char>());
}

// Sends one packet (or the flush packet) and drains the decoder.
bool decode(AVCodecContext *ctx, const AVPacket *pkt, AVFrame *frame) {
	int ret = avcodec_send_packet(ctx, pkt);
	if (ret < 0 && ret != AVERROR_EOF) {
		spdlog::debug("avcodec_send_packet: {}", av_error_string(ret));
		return false;
	}
	while (true) {
		ret = avcodec_receive_frame(ctx, frame);
		if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) return true;
		if (ret < 0) {
			spdlog::debug("avcodec_receive_frame: {}", av_error_string(ret));
			return false;
		}
		av_frame_unref(frame);
	}
}

// Demux and decode every packet of an in-memory fragmented MP4.
Result<void> check_media(const std::string &media) {
	if (media.empty()) return outcome::failure(errc::validation_failed);

	MemoryReader reader{&media};
	AVFormatContext *fmt_ctx = avformat_alloc_context();
	AVIOContext *avio_ctx = nullptr;
	bool opened = false;

	BOOST_SCOPE_EXIT_ALL(&fmt_ctx, &avio_ctx, &opened) {
		if (opened) {
			avformat_close_input(&fmt_ctx);
		} else if (fmt_ctx) {
			avformat_free_context(fmt_ctx);
		}
		if (avio_ctx) {
			av_freep(&avio_ctx->buffer);
			avio_context_free(&avio_ctx);
		}
	};

	if (!fmt_ctx) return outcome::failure(errc::validation_failed);

	auto *io_buffer = static_cast<unsigned char *>(av_malloc(kIOBufferSize));
	if (!io_buffer) return outcome::failure(errc::validation_failed);
	avio_ctx = avio_alloc_context(io_buffer, kIOBufferSize, 0, &reader,
								  &read_memory, nullptr, &seek_memory);
	if (!avio_ctx) {
		av_free(io_buffer);
		return outcome::failure(errc::validation_failed);
	}
	fmt_ctx->pb = avio_ctx;
	fmt_ctx->flags |= AVFMT_FLAG_CUSTOM_IO;

	auto *fmt = av_find_input_format("mp4");
	int ret = avformat_open_input(&fmt_ctx, nullptr, fmt, nullptr);
	if (ret < 0) {
		// avformat_open_input frees the context on failure
		fmt_ctx = nullptr;
		spdlog::debug("avformat_open_input: {}", av_error_string(ret));
		return outcome::failure(errc::validation_failed);
	}
	opened = true;

	if ((ret = avformat_find_stream_info(fmt_ctx, nullptr)) < 0) {
		spdlog::debug("avformat_find_stream_info: {}", av_error_string(ret));
		return outcome::failure(errc::validation_failed);
	}

	std::vector<AVCodecContextPtr> decoders(fmt_ctx->nb_streams);
	for (unsigned int i = 0; i < fmt_ctx->nb_streams; ++i) {
		const AVCodecParameters *par = fmt_ctx->streams[i]->codecpar;
		if (par->codec_type != AVMEDIA_TYPE_AUDIO &&
			par->codec_type != AVMEDIA_TYPE_VIDEO) {
			continue;
		}
		const AVCodec *codec = avcodec_find_decoder(par->codec_id);
		if (!codec) {
			spdlog::debug("No decoder for stream {}", i);
			return outcome::failure(errc::validation_failed);
		}
		AVCodecContextPtr ctx(avcodec_alloc_context3(codec));
		if (!ctx || avcodec_parameters_to_context(ctx.get(), par) < 0 ||
			avcodec_open2(ctx.get(), codec, nullptr) < 0) {
			return outcome::failure(errc::validation_failed);
		}
		decoders[i] = std::move(ctx);
	}

	auto pkt = make_packet();
	AVFramePtr frame(av_frame_alloc());
	if (!pkt || !frame) return outcome::failure(errc::validation_failed);

	int packets = 0;
	while ((ret = av_read_frame(fmt_ctx, pkt.get())) >= 0) {
		auto index = static_cast<std::size_t>(pkt->stream_index);
		bool ok = true;
		if (index < decoders.size() && decoders[index]) {
			ok = decode(decoders[index].get(), pkt.get(), frame.get());
		}
		av_packet_unref(pkt.get());
		if (!ok) return outcome::failure(errc::validation_failed);
		++packets;
	}
	if (ret != AVERROR_EOF) {
		spdlog::debug("av_read_frame: {}", av_error_string(ret));
		return outcome::failure(errc::validation_failed);
	}

	for (auto &ctx : decoders) {
		if (ctx && !decode(ctx.get(), nullptr, frame.get())) {
			return outcome::failure(errc::validation_failed);
		}
	}

	if (packets == 0) return outcome::failure(errc::validation_failed);
	return outcome::success();
}

}  // namespace

Result<void> AvSegmentValidator::probe(std::string_view init_bytes,
									   std::string_view data_bytes) {
	std::string media;
	media.reserve(init_bytes.size() + data_bytes.size());
	media.append(init_bytes);
	media.append(data_bytes);
	return check_media(media);
}

Result<void> AvSegmentValidator::validate_file(
	const std::filesystem::path &init, const std::filesystem::path &segment) {
	auto init_bytes = read_file(init);
	if (!init_bytes) return init_bytes.error();
	auto data_bytes = read_file(segment);
	if (!data_bytes) return data_bytes.error();
	return probe(init_bytes.value(), data_bytes.value());
}

}  // namespace scenedl::media
