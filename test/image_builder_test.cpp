#include <algorithm>

#include <gtest/gtest.h>
#include <codematic/errors.h>
#include "codematic/image_builder.h"
#include "codematic/workspace.h"
#include "fake_engine.h"
#include "utils.h"

TEST(BuildDescriptor, StepsInOrder) {
  std::string desc = BuildDescriptor(Language::GCC_CPP_17, {"main.cpp", "util.cpp"}, "prog");
  EXPECT_EQ(desc,
      "FROM gcc:12\n"
      "COPY . /usr/src/app\n"
      "WORKDIR /usr/src/app\n"
      "RUN [\"g++\",\"-std=c++17\",\"-O2\",\"-o\",\"prog\",\"main.cpp\",\"util.cpp\"]\n");
}

TEST(BuildDescriptor, FollowsBaseImage) {
  ConfigGuard guard;
  kBaseImage = "gcc:13";
  std::string desc = BuildDescriptor(Language::GCC_CPP_17, {"a.cpp"}, "main");
  EXPECT_EQ(desc.substr(0, desc.find('\n')), "FROM gcc:13");
}

TEST(CompileCommand, KeepsSourceOrder) {
  auto cmd = CompileCommand(Language::GCC_CPP_17, {"z.cpp", "a.cpp", "m.h"}, "main");
  std::vector<std::string> expected = {"g++", "-std=c++17", "-O2", "-o", "main", "z.cpp", "a.cpp", "m.h"};
  EXPECT_EQ(cmd, expected);
}

TEST(EngineFraming, Lines) {
  EXPECT_TRUE(IsEngineFramingLine(""));
  EXPECT_TRUE(IsEngineFramingLine("   "));
  EXPECT_TRUE(IsEngineFramingLine("Step 1/4 : FROM gcc:12"));
  EXPECT_TRUE(IsEngineFramingLine(" ---> 1a2b3c4d5e6f"));
  EXPECT_TRUE(IsEngineFramingLine(" ---> Running in 0f9e8d7c6b5a"));
  EXPECT_TRUE(IsEngineFramingLine("Removing intermediate container 0f9e8d7c6b5a"));
  EXPECT_TRUE(IsEngineFramingLine("Successfully built 1a2b3c4d5e6f"));
  EXPECT_TRUE(IsEngineFramingLine("Successfully tagged codematic-1:latest"));
  EXPECT_FALSE(IsEngineFramingLine("main.cpp:3:5: error: expected ';'"));
  EXPECT_FALSE(IsEngineFramingLine("    3 |   return 0"));
  EXPECT_FALSE(IsEngineFramingLine("Stepping through"));
}

class ImageBuilderTest : public ::testing::Test {
 protected:
  ConfigGuard guard_;
  std::shared_ptr<FakeEngine> engine_ = std::make_shared<FakeEngine>();
  CapturingReporter reporter_;
  SubmissionId id_ = SubmissionId::Generate();
  ProgressPublisher publisher_{reporter_, id_};
  Submission sub_ = SquareSubmission({{"3\n", "9\n"}});
  ScopedWorkspace ws_;

  void SetUp() override { ws_.Stage(id_, sub_); }
};

TEST_F(ImageBuilderTest, Success) {
  BuildArtifact artifact = BuildSubmissionImage(*engine_, publisher_, id_, ws_.Path(), sub_);
  EXPECT_EQ(artifact.image_tag, id_.ImageTag());
  EXPECT_EQ(artifact.image_id.substr(0, 7), "sha256:");
  // framing only; nothing the compiler said
  EXPECT_EQ(artifact.build_log, "");
  EXPECT_EQ(engine_->LastDescriptor(), BuildDescriptor(sub_.lang, {"main.cpp", "square.h"}, "main"));
  EXPECT_TRUE(fs::exists(WorkspaceDescriptor(ws_.Path())));
  std::vector<PipelinePhase> phases = {PipelinePhase::BUILDING_IMAGE, PipelinePhase::IMAGE_BUILT};
  EXPECT_EQ(reporter_.Phases(), phases);
  EXPECT_EQ(reporter_.Events()[1].data["tag"].get<std::string>(), id_.ImageTag());
}

TEST_F(ImageBuilderTest, CompileFailureKeepsDiagnostics) {
  engine_->compile_ok = false;
  try {
    BuildSubmissionImage(*engine_, publisher_, id_, ws_.Path(), sub_);
    FAIL() << "build should fail";
  } catch (BuildFailed& err) {
    EXPECT_EQ(err.Log(),
              "main.cpp:1:1: error: 'x' does not name a type\n"
              "The command returned a non-zero code: 1");
  }
  std::vector<PipelinePhase> phases = {PipelinePhase::BUILDING_IMAGE, PipelinePhase::IMAGE_BUILD_FAILED};
  EXPECT_EQ(reporter_.Phases(), phases);
  EXPECT_NE(reporter_.Events()[1].data["log"].get<std::string>().find("does not name a type"),
            std::string::npos);
}

TEST_F(ImageBuilderTest, LogTruncated) {
  kMaxBuildLogLength = 64;
  engine_->compile_ok = false;
  engine_->diagnostics = {std::string(200, 'e')};
  try {
    BuildSubmissionImage(*engine_, publisher_, id_, ws_.Path(), sub_);
    FAIL() << "build should fail";
  } catch (BuildFailed& err) {
    EXPECT_EQ(err.Log(), std::string(64, 'e') + "\n[Build log truncated after 64 bytes]");
  }
}

TEST_F(ImageBuilderTest, EngineUnreachable) {
  engine_->fail_build_request = true;
  EXPECT_THROW(BuildSubmissionImage(*engine_, publisher_, id_, ws_.Path(), sub_), EngineError);
  std::vector<PipelinePhase> phases = {PipelinePhase::BUILDING_IMAGE, PipelinePhase::IMAGE_BUILD_FAILED};
  EXPECT_EQ(reporter_.Phases(), phases);
  EXPECT_EQ(reporter_.Events()[1].data["log"].get<std::string>(), "connection refused");
  // the outcome still comes from the lookup
  EXPECT_EQ(engine_->Calls().back(), "find " + id_.ImageTag());
}

TEST_F(ImageBuilderTest, LookupFailure) {
  engine_->fail_find_image = true;
  EXPECT_THROW(BuildSubmissionImage(*engine_, publisher_, id_, ws_.Path(), sub_), EngineError);
  std::vector<PipelinePhase> phases = {PipelinePhase::BUILDING_IMAGE, PipelinePhase::IMAGE_BUILD_FAILED};
  EXPECT_EQ(reporter_.Phases(), phases);
  EXPECT_EQ(reporter_.Events()[1].data["log"].get<std::string>(), "daemon timeout");
}

TEST_F(ImageBuilderTest, ScopedImageRemovesOnRelease) {
  {
    ScopedImage image(engine_);
    image.Build(publisher_, id_, ws_.Path(), sub_);
    EXPECT_EQ(engine_->Images(), std::vector<std::string>{id_.ImageTag()});
    image.Release();
    EXPECT_TRUE(engine_->Images().empty());
    image.Release();
  }
  auto calls = engine_->Calls();
  EXPECT_EQ(std::count(calls.begin(), calls.end(), "rmi " + id_.ImageTag()), 1);
}

TEST_F(ImageBuilderTest, ScopedImageRemovesAfterFailedBuild) {
  engine_->compile_ok = false;
  {
    ScopedImage image(engine_);
    EXPECT_THROW(image.Build(publisher_, id_, ws_.Path(), sub_), BuildFailed);
    EXPECT_TRUE(image.Active());
  }
  auto calls = engine_->Calls();
  EXPECT_EQ(calls.back(), "rmi " + id_.ImageTag());
}

TEST_F(ImageBuilderTest, RemoveFailureIsSwallowed) {
  ScopedImage image(engine_);
  image.Build(publisher_, id_, ws_.Path(), sub_);
  engine_->fail_remove_image = true;
  EXPECT_NO_THROW(image.Release());
  EXPECT_FALSE(image.Active());
}
