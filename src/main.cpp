/**
 * @file main.cpp
 * @brief 项目主程序入口。
 * @details
 * 逐帧读取检测结果（以及可选的源视频），交给追踪会话，
 * 把追踪结果写成 MOTChallenge 格式的文本，或绘制到输出视频上。
 */

#include "Annotator.hpp"
#include "Config.hpp"
#include "DetectionFileReader.hpp"
#include "Logger.hpp"
#include "TrackWriter.hpp"
#include "TrackingSession.hpp"

#include <opencv2/core/utility.hpp>
#include <opencv2/videoio.hpp>

#include <iostream>
#include <memory>

namespace {

const char* kKeys =
    "{help h usage ? |      | print this message }"
    "{config c       |      | configuration file (OpenCV YAML) }"
    "{detections d   |      | MOTChallenge detection file }"
    "{video v        |      | source video, frames are read in order }"
    "{output_video   |      | annotated video output path }"
    "{output_tracks o|      | MOTChallenge result output path }"
    "{log_level      |      | trace, debug, info, warn, error, critical, off }"
    "{log_file       |      | log file path }";

// 命令行参数覆盖配置文件
void apply_overrides(const cv::CommandLineParser& parser, AppConfig& config) {
    if (parser.has("detections")) config.detections_path = parser.get<std::string>("detections");
    if (parser.has("video")) config.video_path = parser.get<std::string>("video");
    if (parser.has("output_video")) config.output_video_path = parser.get<std::string>("output_video");
    if (parser.has("output_tracks")) config.output_tracks_path = parser.get<std::string>("output_tracks");
    if (parser.has("log_level")) config.log_level = parser.get<std::string>("log_level");
    if (parser.has("log_file")) config.log_file = parser.get<std::string>("log_file");
}

}  // namespace

int main(int argc, char* argv[]) {
    cv::CommandLineParser parser(argc, argv, kKeys);
    parser.about("frametrack: multi-object tracking over per-frame detections");
    if (parser.has("help")) {
        parser.printMessage();
        return 0;
    }

    try {
        // =========================================================================
        // 1. 参数配置 (Configuration)
        // =========================================================================
        AppConfig config;
        if (parser.has("config")) {
            std::string config_path = parser.get<std::string>("config");
            if (!config.load_from_file(config_path)) {
                std::cerr << "Error: Cannot load config file: " << config_path << std::endl;
                return 1;
            }
        }
        apply_overrides(parser, config);
        if (!parser.check()) {
            parser.printErrors();
            return 1;
        }

        Logger::init(config.log_file, parse_log_level(config.log_level));

        if (config.detections_path.empty()) {
            FRAMETRACK_LOG_ERROR("main", "No detection file given (--detections or io.detections)");
            return 1;
        }

        // =========================================================================
        // 2. 初始化 (Initialization)
        // =========================================================================
        DetectionFileReader detector(config.detections_path);
        TrackingSession session(config.tracker);
        Annotator annotator(config.class_names, config.class_aliases);

        FRAMETRACK_LOG_INFO("main", "Loaded {} detections over {} frames from {}",
                            detector.detection_count(), detector.last_frame(), config.detections_path);

        std::unique_ptr<TrackWriter> track_writer;
        if (!config.output_tracks_path.empty()) {
            track_writer = std::make_unique<TrackWriter>(config.output_tracks_path);
        }

        cv::VideoCapture cap;
        if (!config.video_path.empty()) {
            cap.open(config.video_path);
            if (!cap.isOpened()) {
                FRAMETRACK_LOG_ERROR("main", "Cannot open video source: {}", config.video_path);
                return 1;
            }
        } else if (!config.output_video_path.empty()) {
            FRAMETRACK_LOG_ERROR("main", "An output video needs a source video (--video)");
            return 1;
        }

        cv::VideoWriter video_writer;

        // =========================================================================
        // 3. 主循环 (Main Loop)
        // =========================================================================
        cv::Mat frame;
        int frame_number = 0;
        int rejected_total = 0;
        while (true) {
            if (cap.isOpened()) {
                if (!cap.read(frame) || frame.empty()) {
                    FRAMETRACK_LOG_INFO("main", "End of video stream.");
                    break;
                }
            } else if (frame_number >= detector.last_frame()) {
                break;
            }
            frame_number++;

            // a. 获取检测
            std::vector<Detection> detections = detector.detect(frame_number, frame);

            // b. 更新追踪器
            FrameResult result = session.update(detections);
            rejected_total += static_cast<int>(result.rejected.size());

            // c. 输出结果
            if (track_writer) {
                track_writer->write(result);
            }

            if (!config.output_video_path.empty()) {
                annotator.draw(frame, result.tracks);
                if (!video_writer.isOpened()) {
                    double fps = cap.get(cv::CAP_PROP_FPS);
                    video_writer.open(config.output_video_path,
                                      cv::VideoWriter::fourcc('m', 'p', '4', 'v'),
                                      fps > 0 ? fps : 30.0, frame.size());
                    if (!video_writer.isOpened()) {
                        FRAMETRACK_LOG_ERROR("main", "Cannot create output video: {}", config.output_video_path);
                        return 1;
                    }
                }
                video_writer.write(frame);
            }
        }

        // 释放资源
        cap.release();
        video_writer.release();

        FRAMETRACK_LOG_INFO("main", "Processed {} frames: {} tracks created, {} removed, {} detections rejected",
                            session.frame_count(), session.created_count(), session.removed_count(),
                            rejected_total);
        if (track_writer) {
            FRAMETRACK_LOG_INFO("main", "Wrote {} track lines to {}",
                                track_writer->lines_written(), config.output_tracks_path);
        }
        Logger::shutdown();

    } catch (const cv::Exception& e) {
        std::cerr << "OpenCV error: " << e.what() << std::endl;
        return -1;
    } catch (const std::exception& e) {
        std::cerr << "Standard error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
