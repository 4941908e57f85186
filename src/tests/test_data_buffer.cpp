#include <gtest/gtest.h>
#include <QThread>
#include <atomic>
#include <memory>

#include "modua/runtime/data_buffer.h"
#include "modua/runtime/diagnostics.h"

using namespace modua;

TEST(DataBufferTest, UpdateAndRead) {
    DataBuffer buffer;
    buffer.setTagInfo("C.D.T", "Word", "Read/Write");
    buffer.updateTag("C.D.T", 42, 1000.5, "Good", 3);

    TagSnapshot s;
    ASSERT_TRUE(buffer.tagData("C.D.T", s));
    EXPECT_EQ(s.value.toInt(), 42);
    EXPECT_EQ(s.quality, "Good");
    EXPECT_EQ(s.updateCount, 3);
    EXPECT_EQ(s.dataType, "Word");
    EXPECT_EQ(s.access, "Read/Write");
    EXPECT_TRUE(s.lastUpdate.isValid());
    EXPECT_FALSE(buffer.tagData("missing", s));
    EXPECT_FALSE(buffer.tagValue("missing").isValid());
}

TEST(DataBufferTest, EvictsOldestBeyondCapacity) {
    DataBuffer buffer(2);
    buffer.updateTag("a", 1, 0, "Good", 1);
    buffer.updateTag("b", 2, 0, "Good", 1);
    buffer.updateTag("a", 3, 0, "Good", 2);
    buffer.updateTag("c", 4, 0, "Good", 1);
    EXPECT_EQ(buffer.size(), 2);
    EXPECT_FALSE(buffer.tagValue("a").isValid());
    EXPECT_EQ(buffer.tagValue("c").toInt(), 4);
}

TEST(DataBufferTest, WriteBackAndClear) {
    DataBuffer buffer;
    buffer.writeTagValue("x", 1.5);
    TagSnapshot s;
    ASSERT_TRUE(buffer.tagData("x", s));
    EXPECT_DOUBLE_EQ(s.value.toDouble(), 1.5);
    EXPECT_TRUE(s.lastWrite.isValid());
    EXPECT_EQ(buffer.allTags().size(), 1);
    buffer.clear();
    EXPECT_EQ(buffer.size(), 0);
}

TEST(DiagnosticsTest, RecordsOnlyWithListeners) {
    DiagnosticsManager diagnostics(10);
    diagnostics.publish("dropped");
    EXPECT_TRUE(diagnostics.snapshot().isEmpty());

    int received = 0;
    const QString token = diagnostics.registerListener("t", [&received](const DiagnosticRecord&) { ++received; });
    diagnostics.publish("kept");
    EXPECT_EQ(received, 1);
    ASSERT_EQ(diagnostics.snapshot().size(), 1);
    EXPECT_EQ(diagnostics.snapshot()[0].text, "kept");
    EXPECT_EQ(diagnostics.snapshot()[0].timestamp.size(), 12);

    diagnostics.unregisterListener(token);
    EXPECT_EQ(diagnostics.listenerCount(), 0);
    diagnostics.publish("dropped again");
    EXPECT_EQ(diagnostics.snapshot().size(), 1);
}

TEST(DiagnosticsTest, RingBufferKeepsNewest) {
    DiagnosticsManager diagnostics(3);
    diagnostics.registerListener("t", [](const DiagnosticRecord&) {});
    for (int i = 0; i < 5; ++i) diagnostics.publish(QString::number(i));

    const auto records = diagnostics.snapshot();
    ASSERT_EQ(records.size(), 3);
    EXPECT_EQ(records[0].text, "2");
    EXPECT_EQ(records[2].text, "4");
}

TEST(DiagnosticsTest, OnlyTxRxFilter) {
    DiagnosticsManager diagnostics(10, true);
    QStringList lines;
    diagnostics.registerListener("t", [&lines](const DiagnosticRecord& r) { lines << r.text; });

    diagnostics.publish("CONNECTED: x");
    DiagnosticContext tx;
    tx.direction = "TX";
    diagnostics.publish("[ADU] TX: | 01 03 |", tx);
    diagnostics.publish("free text RX: 01");
    EXPECT_EQ(lines.size(), 2);

    diagnostics.setOnlyTxRx(false);
    diagnostics.publish("CONNECTED: y");
    EXPECT_EQ(lines.size(), 3);
}

TEST(DiagnosticsTest, MatcherFiltersPerListener) {
    DiagnosticsManager diagnostics;
    QStringList a;
    QStringList b;
    diagnostics.registerListener("a", [&a](const DiagnosticRecord& r) { a << r.text; },
                                 [](const DiagnosticRecord& r) { return r.context.configId == "Ch_A"; });
    diagnostics.registerListener("b", [&b](const DiagnosticRecord& r) { b << r.text; });

    DiagnosticContext ctx;
    ctx.configId = "Ch_B";
    diagnostics.publish("x", ctx);
    EXPECT_TRUE(a.isEmpty());
    EXPECT_EQ(b.size(), 1);

    diagnostics.stop();
    EXPECT_EQ(diagnostics.listenerCount(), 0);
    EXPECT_TRUE(diagnostics.snapshot().isEmpty());
}

TEST(DiagnosticsTest, UnregisterWaitsForInFlightCallbacks) {
    DiagnosticsManager diagnostics(100);
    std::atomic<bool> running{true};
    std::atomic<bool> released{false};
    std::atomic<int> lateCalls{0};

    std::unique_ptr<QThread> publisher(QThread::create([&]() {
        while (running.load()) diagnostics.publish("TX: 01 03 00 00 00 01");
    }));
    publisher->start();

    for (int round = 0; round < 50; ++round) {
        released.store(false);
        const QString token = diagnostics.registerListener("slow", [&](const DiagnosticRecord&) {
            QThread::usleep(200);
            if (released.load()) ++lateCalls;
        });
        QThread::usleep(300);
        diagnostics.unregisterListener(token);
        released.store(true);
    }

    running.store(false);
    publisher->wait();
    EXPECT_EQ(lateCalls.load(), 0);
    EXPECT_EQ(diagnostics.listenerCount(), 0);
}
