#include "MediaProbe.h"
#include "Logging.h"
#include <limits>

#ifdef HAS_FFMPEG
extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/mathematics.h>
}
#endif

MediaProbe::MediaProbe(QObject* parent) : QObject(parent) {}
MediaProbe::~MediaProbe() = default;

bool MediaProbe::probe(const QString& filePath) {
    m_info = AssetInfo{};
    m_info.filePath = filePath;
    m_error.clear();

#ifdef HAS_FFMPEG
    AVFormatContext* fmtCtx = nullptr;
    int ret = avformat_open_input(&fmtCtx, filePath.toUtf8().constData(), nullptr, nullptr);
    if (ret < 0) {
        char errBuf[256];
        av_strerror(ret, errBuf, sizeof(errBuf));
        m_error = QString("Cannot open file: %1 (%2)").arg(filePath, errBuf);
        qCWarning(lcMedia) << m_error;
        return false;
    }

    ret = avformat_find_stream_info(fmtCtx, nullptr);
    if (ret < 0) {
        m_error = "Cannot find stream info";
        qCWarning(lcMedia) << m_error << filePath;
        avformat_close_input(&fmtCtx);
        return false;
    }

    m_info.containerFormat = QString(fmtCtx->iformat->long_name);

    AVStream* videoStream = nullptr;
    for (unsigned i = 0; i < fmtCtx->nb_streams; ++i) {
        AVStream* stream = fmtCtx->streams[i];
        AVCodecParameters* par = stream->codecpar;

        if (par->codec_type == AVMEDIA_TYPE_VIDEO && !m_info.hasVideo) {
            m_info.hasVideo = true;
            m_info.videoWidth = par->width;
            m_info.videoHeight = par->height;
            videoStream = stream;

            const AVCodecDescriptor* desc = avcodec_descriptor_get(par->codec_id);
            m_info.videoCodec = desc ? QString(desc->name) : "unknown";

            if (stream->avg_frame_rate.den > 0 && stream->avg_frame_rate.num > 0) {
                m_info.videoFps = av_q2d(stream->avg_frame_rate);
            } else if (stream->r_frame_rate.den > 0 && stream->r_frame_rate.num > 0) {
                m_info.videoFps = av_q2d(stream->r_frame_rate);
            }
        } else if (par->codec_type == AVMEDIA_TYPE_AUDIO) {
            m_info.hasAudio = true;
        }
    }

    // Prefer the video stream's own timescale; fall back to the container
    // duration rescaled to the default timescale.
    if (videoStream && videoStream->duration > 0
        && videoStream->time_base.num == 1
        && videoStream->time_base.den <= std::numeric_limits<int32_t>::max()) {
        m_info.duration = MediaTime(videoStream->duration, videoStream->time_base.den);
    } else if (fmtCtx->duration > 0) {
        AVRational containerBase{1, AV_TIME_BASE};
        AVRational target{1, MediaTime::DefaultTimescale};
        m_info.duration = MediaTime(av_rescale_q(fmtCtx->duration, containerBase, target),
                                    MediaTime::DefaultTimescale);
    }

    avformat_close_input(&fmtCtx);

    if (m_info.duration.value <= 0) {
        m_error = QString("No duration in: %1").arg(filePath);
        qCWarning(lcMedia) << m_error;
        return false;
    }

    qCInfo(lcMedia) << "Probed" << filePath << "duration" << m_info.durationSeconds() << "s"
                    << "timescale" << m_info.duration.timescale;
    return true;
#else
    m_error = "FFmpeg not available";
    qCWarning(lcMedia) << m_error << "- cannot probe" << filePath;
    return false;
#endif
}
