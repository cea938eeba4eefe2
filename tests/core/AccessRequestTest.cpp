#include <QtTest/QtTest>

#include "eventually/core/AccessRequest.hpp"
#include "eventually/data/InMemoryEventSource.hpp"

#include <thread>

using namespace eventually;

namespace {
// Answers from a worker thread after a short delay.
class ThreadedSource : public data::InMemoryEventSource
{
public:
    ~ThreadedSource() override
    {
        if (m_worker.joinable()) {
            m_worker.join();
        }
    }

    void requestAccess(AccessCallback completion) override
    {
        m_worker = std::thread([completion]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            completion(true);
        });
    }

private:
    std::thread m_worker;
};
} // namespace

class AccessRequestTest : public QObject
{
    Q_OBJECT

private slots:
    void grantsAccess();
    void reportsDenial();
    void timesOutWithoutAnswer();
    void acceptsAnswerFromAnotherThread();
};

void AccessRequestTest::grantsAccess()
{
    data::InMemoryEventSource source;
    QVERIFY(core::requestAccessBlocking(source, std::chrono::milliseconds(100)));
}

void AccessRequestTest::reportsDenial()
{
    data::InMemoryEventSource source;
    source.setAccessMode(data::InMemoryEventSource::AccessMode::Denied);
    QVERIFY(!core::requestAccessBlocking(source, std::chrono::milliseconds(100)));
}

void AccessRequestTest::timesOutWithoutAnswer()
{
    data::InMemoryEventSource source;
    source.setAccessMode(data::InMemoryEventSource::AccessMode::NeverAnswers);

    QElapsedTimer timer;
    timer.start();
    QVERIFY(!core::requestAccessBlocking(source, std::chrono::milliseconds(50)));
    QVERIFY(timer.elapsed() >= 40);

    // A late answer must not touch the finished request.
    auto late = source.takePendingCallback();
    QVERIFY(late);
    late(true);
    late(false);
}

void AccessRequestTest::acceptsAnswerFromAnotherThread()
{
    ThreadedSource source;
    QVERIFY(core::requestAccessBlocking(source, std::chrono::milliseconds(2000)));
}

QTEST_GUILESS_MAIN(AccessRequestTest)
#include "AccessRequestTest.moc"
