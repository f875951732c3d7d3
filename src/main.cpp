#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include "uplift/core/logger.hpp"
#include "uplift/core/config.hpp"
#include "uplift/core/cli.hpp"
#include "uplift/core/utils.hpp"
#include "uplift/http/beast_transport.hpp"
#include "uplift/http/http_client.hpp"
#include "uplift/http/remote_source.hpp"
#include "uplift/http/throttling_interceptor.hpp"
#include "uplift/transfer/progress_reporter.hpp"
#include "uplift/transfer/rate_limited_stream.hpp"
#include "uplift/upload/media_uploader.hpp"
#include "uplift/upload/video_metadata.hpp"

using namespace uplift;

namespace {

void apply_flag_overrides(const core::CommandLineParser& parser, core::Config& config) {
    if (parser.has_option("ratelimit")) {
        config.set("upload.rate_limit_kbps", parser.get_option("ratelimit"));
    }
    if (parser.has_option("token")) {
        config.set("auth.access_token", parser.get_option("token"));
    }
    if (parser.has_option("privacy")) {
        config.set("upload.privacy", parser.get_option("privacy"));
    }
}

upload::VideoMetadata build_metadata(const core::CommandLineParser& parser, const core::Config& config) {
    upload::VideoMetadata flags;
    flags.title = parser.get_option("title");
    flags.description = parser.get_option("description");
    flags.category_id = parser.get_option("categoryId");
    flags.privacy_status = config.get_string("upload.privacy", "private");
    flags.tags = upload::VideoMetadata::parse_tags(parser.get_option("tags"));

    upload::VideoMetadata metadata;
    if (parser.has_option("metaJSON")) {
        try {
            metadata = upload::VideoMetadata::from_json_file(parser.get_option("metaJSON"));
        } catch (const upload::MetadataError& e) {
            std::cout << e.what() << "\n";
            std::cout << "Will use command line flags instead\n";
            LOG_WARN("{}", e.what());
            metadata = upload::VideoMetadata{};
        }
    }

    metadata.apply_fallbacks(flags);
    return metadata;
}

std::shared_ptr<transfer::ByteSource> open_source(const std::string& filename, http::Transport& transport,
                                                  std::chrono::seconds timeout) {
    if (http::RemoteSource::is_remote(filename)) {
        auto hint = http::RemoteSource::advertised_length(transport, filename);
        return std::make_shared<http::RemoteSource>(filename, hint, timeout);
    }
    return std::make_shared<transfer::FileSource>(filename);
}

} // namespace

int main(int argc, char* argv[]) {
    core::CommandLineParser parser("uplift");

    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }

    if (parser.has_option("help")) {
        parser.print_help();
        return 0;
    }

    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }

    auto& config = core::Config::instance();
    config.set_defaults();

    auto config_file = core::utils::FileUtils::expand_home(parser.get_option("config"));
    if (core::utils::FileUtils::exists(config_file)) {
        if (!config.load_from_file(config_file.string())) {
            std::cerr << "Warning: could not read " << config_file.string() << "\n";
        }
        for (const auto& warning : config.load_warnings()) {
            std::cerr << "Warning: " << config_file.string() << ": " << warning << "\n";
        }
    }
    apply_flag_overrides(parser, config);

    auto problems = config.validate();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            std::cerr << "Error: " << problem << "\n";
        }
        return 1;
    }

    bool verbose = parser.has_option("verbose");
    auto log_level = core::parse_log_level(config.get_string("log.level", "info")).value_or(core::LogLevel::Info);
    if (verbose) {
        log_level = core::LogLevel::Debug;
    }
    core::Logger::initialize(config.get_string("log.file", "uplift.log"), log_level,
                             verbose ? log_level : core::LogLevel::Warn);

    std::string filename = parser.get_option("filename");
    if (filename.empty()) {
        std::cout << "You must provide a filename of a video file to upload\n";
        parser.print_help();
        return 1;
    }

    auto rate_kbps = config.get_uint64("upload.rate_limit_kbps");
    auto timeout = std::chrono::seconds(config.get_as<int64_t>("http.timeout_seconds").value_or(30));

    auto metadata = build_metadata(parser, config);

    auto network = std::make_shared<http::BeastTransport>();
    network->set_timeout(timeout);

    std::shared_ptr<transfer::ByteSource> source;
    try {
        source = open_source(filename, *network, timeout);
    } catch (const transfer::SourceError& e) {
        LOG_CRITICAL("{}", e.what());
        core::Logger::shutdown();
        return 1;
    }

    uint64_t total_bytes = source->size().value_or(0);
    uint64_t rate = transfer::RateLimitedStream::kbps_to_bytes_per_second(rate_kbps);
    LOG_INFO("Uploading {} ({} bytes), rate limit {}", filename, total_bytes,
             rate > 0 ? std::to_string(rate_kbps) + " kbps" : std::string("none"));

    auto interceptor = std::make_shared<http::ThrottlingInterceptor>(network, total_bytes, rate);

    http::HttpClient client(interceptor);
    client.set_access_token(config.get_string("auth.access_token"));
    if (!client.has_access_token()) {
        LOG_WARN("No access token configured; the upload endpoint will likely reject the request");
    }

    std::unique_ptr<transfer::ProgressReporter> reporter;
    if (!parser.has_option("quiet")) {
        auto interval = std::chrono::milliseconds(config.get_as<int64_t>("progress.interval_ms").value_or(1000));
        reporter = std::make_unique<transfer::ProgressReporter>(
            [interceptor] { return interceptor->monitor(); }, std::cout, interval);
        reporter->start();
    }

    auto stop_reporter = [&reporter] {
        if (reporter) {
            reporter->stop();
        }
    };

    int exit_code = 0;
    try {
        upload::MediaUploader uploader(client, config.get_string("upload.endpoint"),
                                       config.get_uint64("upload.chunk_size", 8 * 1024 * 1024));

        std::cout << "Uploading file '" << filename << "'...\n";
        auto result = uploader.upload(metadata, source);
        stop_reporter();

        std::cout << "Upload successful! Video ID: " << result.video_id << "\n";
        LOG_INFO("Upload finished with status {}, video id {}", result.status, result.video_id);
    } catch (const http::HttpStatusError& e) {
        stop_reporter();
        LOG_CRITICAL("Error making upload API call: {}", e.what());
        if (!e.body().empty()) {
            LOG_DEBUG("Response body: {}", e.body());
        }
        exit_code = 1;
    } catch (const http::TransportError& e) {
        stop_reporter();
        LOG_CRITICAL("Error making upload API call: {}", e.what());
        exit_code = 1;
    } catch (const transfer::SourceError& e) {
        stop_reporter();
        LOG_CRITICAL("{}", e.what());
        exit_code = 1;
    } catch (const upload::UploadError& e) {
        stop_reporter();
        LOG_CRITICAL("Upload failed: {}", e.what());
        exit_code = 1;
    } catch (const std::invalid_argument& e) {
        stop_reporter();
        LOG_CRITICAL("Invalid upload settings: {}", e.what());
        exit_code = 1;
    }

    core::Logger::shutdown();
    return exit_code;
}
