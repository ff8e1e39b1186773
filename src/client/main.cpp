#include "client/AlertNotifier.h"
#include "client/DetectionSession.h"
#include "client/DetectorConfig.h"
#include "client/FaceLandmarks.h"
#include "client/FrameEvent.h"
#include "client/FrameRateMeter.h"
#include "client/SyntheticLandmarkSource.h"

#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#if defined(DG_ENABLE_GRPC)
#include "client/MonitorClient.h"
#endif

int main() {
  std::cout << "================================================\n";
  std::cout << "  DriverGuard Drowsiness Detection Client\n";
  std::cout << "================================================\n\n";

  const dg::client::ConfigLoadResult loaded = dg::client::LoadClientConfig();
  if (!loaded.success) {
    std::cerr << "[Config] Invalid configuration: " << loaded.error_message << std::endl;
    return 1;
  }
  const dg::client::ClientConfig& config = loaded.config;

  std::string session_error;
  const std::unique_ptr<dg::client::DetectionSession> session =
      dg::client::DetectionSession::Create(config.detector, &session_error);
  if (!session) {
    std::cerr << "[Config] Invalid detector configuration: " << session_error << std::endl;
    return 1;
  }
  dg::client::AlertNotifier notifier;

#if defined(DG_ENABLE_GRPC)
  dg::client::MonitorClient monitor(config.monitor_address, "driverguard-client");
  const bool monitor_connected = monitor.Connect();
  if (!monitor_connected) {
    std::cerr << "[Monitor] Continuing without alert monitor" << std::endl;
  }
#endif

  const dg::client::PresentationConfig presentation = config.presentation;
  notifier.SetResultCallback([&](const dg::client::FrameResult& result) {
    // Only state changes and alert frames are printed; steady frames are noise.
    if (result.alert_raised || result.alert_cleared ||
        (result.state.alert_active && result.frame_index % 10 == 0)) {
      std::cout << dg::client::ToJsonString(dg::client::ToJson(result, presentation))
                << "\n";
    }
#if defined(DG_ENABLE_GRPC)
    if (monitor_connected) {
      monitor.Send(result);
    }
#endif
  });
  notifier.Start();

  if (config.detector.ear_consecutive_frames >
      dg::client::SyntheticLandmarkSource::kMaxSelfTestRun) {
    std::cout << "[Client] Scripted closures are capped at "
              << dg::client::SyntheticLandmarkSource::kMaxSelfTestRun
              << " frames and may not reach ear_consecutive_frames="
              << config.detector.ear_consecutive_frames << std::endl;
  }
  dg::client::SyntheticLandmarkSource source(
      dg::client::SyntheticLandmarkSource::SelfTestScript(
          config.detector.ear_consecutive_frames));
  dg::client::FrameRateMeter fps_meter;
  std::cout << "[Client] Running self-test sequence: " << source.TotalFrames()
            << " frames\n";

  std::vector<cv::Point2d> shape;
  std::int64_t no_face_frames = 0;
  while (source.NextFrame(shape)) {
    const auto face = dg::client::ExtractEyes(shape);
    if (!face) {
      no_face_frames++;
    }
    notifier.Publish(session->ProcessFace(face));
    if (fps_meter.Tick() && presentation.show_fps) {
      std::cout << "[Client] FPS: " << std::fixed << std::setprecision(2)
                << fps_meter.Fps() << std::endl;
    }
  }

  notifier.Stop();
  std::cout << "[Client] Session stopped" << std::endl;
#if defined(DG_ENABLE_GRPC)
  monitor.Close();
#endif

  const dg::client::FrameResult last = session->Snapshot();
  std::cout << "\n================================================\n";
  std::cout << "  Frames processed: " << last.frame_index + 1 << "\n";
  std::cout << "  Frames without a face: " << no_face_frames << "\n";
  std::cout << "  Drowsiness alerts: " << last.alerts_total << "\n";
  std::cout << "  Final state: " << dg::client::ToString(last.state.State()) << "\n";
  std::cout << "================================================\n";
  return 0;
}
