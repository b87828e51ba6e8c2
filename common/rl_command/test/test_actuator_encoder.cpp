#include <rl/command/actuator_encoder.hpp>
#include <rl/common/test_entrypoint.hpp>

#include <memory>

#include <json/json.h>

namespace rl {

namespace {

void decodeLine(const std::string& line, real_t* left, real_t* right, int* type)
{
  ASSERT_FALSE(line.empty());
  ASSERT_EQ(line.back(), '\n');
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errors;
  ASSERT_TRUE(reader->parse(line.data(), line.data() + line.size() - 1, &root, &errors)) << errors;
  *left = root["L"].asDouble();
  *right = root["R"].asDouble();
  *type = root["T"].asInt();
}

} // namespace

TEST(DifferentialDriveTest, StraightAheadIsScaledByMaxDuty)
{
  const ActuatorCommand cmd = mixDifferentialDrive(1.0, 0.0, 0.5);
  EXPECT_DOUBLE_EQ(cmd.left(), 0.5);
  EXPECT_DOUBLE_EQ(cmd.right(), 0.5);
}

TEST(DifferentialDriveTest, SteeringForwardAndReverse)
{
  ActuatorCommand cmd = mixDifferentialDrive(0.5, 0.5, 0.5);
  EXPECT_DOUBLE_EQ(cmd.left(), 0.375);
  EXPECT_DOUBLE_EQ(cmd.right(), 0.125);

  // Reversing keeps the steering direction of the vehicle's front.
  cmd = mixDifferentialDrive(-0.5, 0.5, 0.5);
  EXPECT_DOUBLE_EQ(cmd.left(), -0.375);
  EXPECT_DOUBLE_EQ(cmd.right(), -0.125);
}

TEST(DifferentialDriveTest, ClampsToMaxDuty)
{
  const ActuatorCommand cmd = mixDifferentialDrive(1.0, 1.0, 0.5);
  EXPECT_DOUBLE_EQ(cmd.left(), 0.5);
  EXPECT_DOUBLE_EQ(cmd.right(), 0.0);

  const ActuatorCommand rev = mixDifferentialDrive(-1.0, -1.0, 0.5);
  EXPECT_DOUBLE_EQ(rev.left(), 0.0);
  EXPECT_DOUBLE_EQ(rev.right(), -0.5);
}

TEST(DifferentialDriveTest, NoTurningOnTheSpot)
{
  const ActuatorCommand cmd = mixDifferentialDrive(0.0, 1.0, 0.5);
  EXPECT_TRUE(cmd.isZero());
}

TEST(DifferentialDriveTest, RoundsToMillis)
{
  const ActuatorCommand cmd = mixDifferentialDrive(0.3333, 0.0, 0.5);
  EXPECT_NEAR(cmd.left(), 0.167, 1e-12);
  EXPECT_NEAR(cmd.right(), 0.167, 1e-12);
}

TEST(DifferentialDriveTest, ThrottleIsRoundedBeforeMixing)
{
  // 0.0013 * 0.5 = 0.00065 mixes as 0.001, so the inner wheel gets
  // 0.001 * 0.6 = 0.0006 -> 0.001 instead of 0.00039 -> 0.
  const ActuatorCommand cmd = mixDifferentialDrive(0.0013, 0.4, 0.5);
  EXPECT_NEAR(cmd.left(), 0.001, 1e-12);
  EXPECT_NEAR(cmd.right(), 0.001, 1e-12);

  const ActuatorCommand rev = mixDifferentialDrive(-0.0013, 0.4, 0.5);
  EXPECT_NEAR(rev.left(), -0.001, 1e-12);
  EXPECT_NEAR(rev.right(), -0.001, 1e-12);

  // Below half a milli the throttle vanishes entirely.
  EXPECT_TRUE(mixDifferentialDrive(0.0008, 1.0, 0.5).isZero());
}

TEST(DifferentialDriveTest, ControlFrameUsesLeftYAndRightX)
{
  ControlFrame frame;
  frame.seq = 42u;
  frame.axes << 0.9, 0.5, 0.0, -0.7;
  const ActuatorCommand cmd = mixControlFrame(frame, 0.5);
  EXPECT_DOUBLE_EQ(cmd.left(), 0.25);
  EXPECT_DOUBLE_EQ(cmd.right(), 0.25);
  EXPECT_EQ(cmd.source_seq, 42u);
}

TEST(JsonLineEncoderTest, EncodesOneCompactLine)
{
  JsonLineEncoder encoder;
  ActuatorCommand cmd;
  cmd.duty << 0.25, -0.1;
  const std::string line = encoder.encode(cmd);
  EXPECT_EQ(line.find(' '), std::string::npos);
  EXPECT_EQ(line.find('\n'), line.size() - 1u);
  EXPECT_EQ(line.compare(0, 5, "{\"L\":"), 0);

  real_t left = 0.0;
  real_t right = 0.0;
  int type = 0;
  decodeLine(line, &left, &right, &type);
  EXPECT_DOUBLE_EQ(left, 0.25);
  EXPECT_DOUBLE_EQ(right, -0.1);
  EXPECT_EQ(type, 1);
}

TEST(JsonLineEncoderTest, ZeroCommand)
{
  JsonLineEncoder encoder;
  real_t left = 1.0;
  real_t right = 1.0;
  int type = 0;
  decodeLine(encoder.encode(ActuatorCommand::zero()), &left, &right, &type);
  EXPECT_EQ(left, 0.0);
  EXPECT_EQ(right, 0.0);
}

TEST(ActuatorEncoderFactoryTest, KnownProtocols)
{
  EXPECT_TRUE(isKnownActuatorProtocol("json_line"));
  EXPECT_FALSE(isKnownActuatorProtocol("sbus"));
  ASSERT_TRUE(makeActuatorEncoder("json_line") != nullptr);
  EXPECT_EQ(makeActuatorEncoder("json_line")->name(), "json_line");
  EXPECT_TRUE(makeActuatorEncoder("sbus") == nullptr);
}

} // namespace rl

RL_UNITTEST_ENTRYPOINT
