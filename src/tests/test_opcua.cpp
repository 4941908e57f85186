#include <gtest/gtest.h>
#include <QCoreApplication>

#include "modua/opcua/opcua_server.h"
#include "modua/opcua/opcua_settings.h"

using namespace modua;

TEST(OpcUaTypeTest, MapsTagTypes) {
    EXPECT_EQ(opcUaTypeFor("Boolean"), OpcUaType::Boolean);
    EXPECT_EQ(opcUaTypeFor("Short"), OpcUaType::Int16);
    EXPECT_EQ(opcUaTypeFor("BCD"), OpcUaType::Int16);
    EXPECT_EQ(opcUaTypeFor("Word(Array)"), OpcUaType::UInt16);
    EXPECT_EQ(opcUaTypeFor("DWord"), OpcUaType::Int32);
    EXPECT_EQ(opcUaTypeFor("QWord"), OpcUaType::Int64);
    EXPECT_EQ(opcUaTypeFor("Float Array"), OpcUaType::Float);
    EXPECT_EQ(opcUaTypeFor("String"), OpcUaType::String);
    EXPECT_EQ(opcUaTypeFor("Mystery"), OpcUaType::Double);
    EXPECT_EQ(opcUaTypeName(OpcUaType::UInt16), "UInt16");
}

TEST(OpcUaTypeTest, ScaledTypeWinsWhenScalingEnabled) {
    EXPECT_EQ(opcUaVariableType("Word", QJsonObject{{"type", "Linear"}, {"scaled_type", "Double"}}),
              OpcUaType::Double);
    EXPECT_EQ(opcUaVariableType("Word", QJsonObject{{"type", "None"}, {"scaled_type", "Double"}}),
              OpcUaType::UInt16);
    EXPECT_EQ(opcUaVariableType("Word", QJsonObject()), OpcUaType::UInt16);
}

TEST(OpcUaTypeTest, AccessLevels) {
    EXPECT_EQ(opcUaAccessLevel("Read/Write"), kAccessRead | kAccessWrite);
    EXPECT_EQ(opcUaAccessLevel("R/W"), kAccessRead | kAccessWrite);
    EXPECT_EQ(opcUaAccessLevel("RW"), kAccessRead | kAccessWrite);
    EXPECT_EQ(opcUaAccessLevel("Write Only"), kAccessWrite);
    EXPECT_EQ(opcUaAccessLevel("Read Only"), kAccessRead);
    EXPECT_EQ(opcUaAccessLevel(""), kAccessRead);
}

TEST(OpcUaSettingsTest, DefaultsEnablePolicyNone) {
    OpcUaSettings s;
    QString error;
    ASSERT_TRUE(OpcUaSettings::fromJson(QJsonObject(), s, error)) << qPrintable(error);
    EXPECT_EQ(s.port, 48480);
    EXPECT_EQ(s.enabledPolicies, QStringList{"policy_none"});
    EXPECT_TRUE(s.anonymous);
    EXPECT_FALSE(s.needsCertificate());
    EXPECT_EQ(s.endpointUrl(), "opc.tcp://0.0.0.0:48480/");
    EXPECT_EQ(securityPolicyInfos().size(), 7);
}

TEST(OpcUaSettingsTest, LegacyAuthenticationString) {
    OpcUaSettings s;
    QString error;
    const QJsonObject legacy{{"authentication", "Username/Password"}, {"username", "op"}, {"password", "pw"}};
    ASSERT_TRUE(OpcUaSettings::fromJson(legacy, s, error)) << qPrintable(error);
    EXPECT_FALSE(s.anonymous);
    EXPECT_EQ(s.username, "op");

    EXPECT_FALSE(OpcUaSettings::fromJson(QJsonObject{{"authentication", "Username/Password"}}, s, error));
    EXPECT_TRUE(error.contains("username"));
}

TEST(OpcUaSettingsTest, NestedSectionsOverrideFlatKeys) {
    const QJsonObject obj{
        {"port", 1000},
        {"general", QJsonObject{{"port", 4840}, {"network_adapter_ip", "127.0.0.1"}, {"application_Name", "Plant"}}},
        {"authentication", QJsonObject{{"auth_type", "Username/Password"}, {"username", "op"}, {"password", "pw"}}},
        {"security_policies", QJsonObject{{"policy_none", "Disable"}, {"policy_encrypt_basic256sha256", "Enable"}}},
        {"certificate", QJsonObject{{"cert_validity", 99}, {"common_name", "plant.local"}}}};
    OpcUaSettings s;
    QString error;
    ASSERT_TRUE(OpcUaSettings::fromJson(obj, s, error)) << qPrintable(error);
    EXPECT_EQ(s.port, 4840);
    EXPECT_EQ(s.applicationName, "Plant");
    EXPECT_FALSE(s.anonymous);
    EXPECT_EQ(s.username, "op");
    EXPECT_EQ(s.enabledPolicies, QStringList{"policy_encrypt_basic256sha256"});
    EXPECT_TRUE(s.needsCertificate());
    EXPECT_EQ(s.certValidityYears, 20);
    ASSERT_EQ(s.policies().size(), 1);
    EXPECT_EQ(s.policies()[0].mode, SecurityPolicyInfo::Mode::SignAndEncrypt);

    // toJson 可以再次解析
    OpcUaSettings again;
    ASSERT_TRUE(OpcUaSettings::fromJson(s.toJson(), again, error)) << qPrintable(error);
    EXPECT_EQ(again.enabledPolicies, s.enabledPolicies);
    EXPECT_EQ(again.commonName, "plant.local");
}

TEST(OpcUaSettingsTest, RejectsInvalidSettings) {
    OpcUaSettings s;
    QString error;
    EXPECT_FALSE(OpcUaSettings::fromJson(QJsonObject{{"port", 0}}, s, error));
    EXPECT_FALSE(OpcUaSettings::fromJson(QJsonObject{{"network_adapter_ip", "10.0.0.300"}}, s, error));
    EXPECT_FALSE(OpcUaSettings::fromJson(QJsonObject{{"auth_type", "Username/Password"}}, s, error));
    EXPECT_TRUE(error.contains("username"));
    EXPECT_FALSE(OpcUaSettings::fromJson(
        QJsonObject{{"security_policies", QJsonObject{{"policy_none", false}}}}, s, error));
    EXPECT_TRUE(error.contains("security policy"));

    SecurityPolicyInfo policy;
    EXPECT_TRUE(securityPolicyForKey("policy_sign_aes128", policy));
    EXPECT_EQ(policy.mode, SecurityPolicyInfo::Mode::Sign);
    EXPECT_FALSE(securityPolicyForKey("policy_rot13", policy));
}

class OpcUaServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        static int argc = 1;
        static char arg0[] = "test";
        static char* argv[] = {arg0};
        if (!QCoreApplication::instance()) {
            new QCoreApplication(argc, argv);
        }
    }
};

TEST_F(OpcUaServerTest, StartsAndUpdatesValues) {
    OpcUaSettings settings;
    settings.host = "127.0.0.1";
    settings.port = 48599;
    OpcUaServer server(settings);

    OpcUaVariable level;
    level.path = "Ch1.Dev1.Level";
    level.displayName = "Level";
    level.folders = QStringList{"Ch1", "Dev1"};
    level.type = OpcUaType::Float;
    level.accessLevel = kAccessRead | kAccessWrite;

    OpcUaVariable name;
    name.path = "Ch1.Dev1.Name";
    name.displayName = "Name";
    name.folders = QStringList{"Ch1", "Dev1"};
    name.type = OpcUaType::String;

    QString error;
    ASSERT_TRUE(server.start({level, name, level}, error)) << qPrintable(error);
    EXPECT_TRUE(server.isRunning());
    EXPECT_EQ(server.variableCount(), 2);
    EXPECT_TRUE(server.hasVariable("Ch1.Dev1.Level"));
    EXPECT_EQ(server.endpointUrl(), "opc.tcp://127.0.0.1:48599/");

    EXPECT_TRUE(server.updateValue("Ch1.Dev1.Level", 12.5));
    EXPECT_TRUE(server.updateValue("Ch1.Dev1.Name", QString("PUMP-01")));
    EXPECT_FALSE(server.updateValue("Ch1.Dev1.Missing", 1));
    EXPECT_FALSE(server.start({level}, error));

    server.stop();
    EXPECT_FALSE(server.isRunning());
    EXPECT_EQ(server.variableCount(), 0);
}
