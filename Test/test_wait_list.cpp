#include <QCoreApplication>
#include <QDebug>

#include "../Core/Queue/WaitList.h"

using namespace STC::Core;
using STC::Core::Descriptor::TaskKind;
using STC::Core::Queue::WaitEntry;
using STC::Core::Queue::WaitList;

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    qInfo() << "=== Wait List Test ===";

    {
        qInfo() << "\n--- Test 1: limit disabled admits everything ---";

        WaitList list(0);
        if (!list.isReady(0) || !list.isReady(1000)) {
            qCritical() << "Unlimited wait list should always be ready";
            return 1;
        }

        list.setMaxConcurrent(-3);
        if (list.maxConcurrent() != 0 || !list.isReady(5)) {
            qCritical() << "Negative limit should be treated as disabled";
            return 1;
        }
    }

    {
        qInfo() << "\n--- Test 2: limit bounds readiness ---";

        WaitList list(2);
        if (!list.isReady(0) || !list.isReady(1)) {
            qCritical() << "Expected ready below limit";
            return 1;
        }
        if (list.isReady(2) || list.isReady(3)) {
            qCritical() << "Expected not ready at or above limit";
            return 1;
        }
    }

    {
        qInfo() << "\n--- Test 3: FIFO order and duplicate rejection ---";

        WaitList list(1);
        if (!list.enqueue("a", TaskKind::Magnet).ok || !list.enqueue("b", TaskKind::Metainfo).ok
            || !list.enqueue("c", TaskKind::Magnet).ok) {
            qCritical() << "Enqueue failed";
            return 1;
        }

        const OperationResult duplicate = list.enqueue("b", TaskKind::Magnet);
        if (duplicate.ok || duplicate.code != ErrorCode::AlreadyExists) {
            qCritical() << "Duplicate enqueue should fail with AlreadyExists:" << errorCodeName(duplicate.code);
            return 1;
        }
        if (list.size() != 3) {
            qCritical() << "Expected 3 entries, got" << list.size();
            return 1;
        }

        WaitEntry entry;
        QStringList order;
        while (list.dequeueNext(entry).ok) {
            order << entry.infoHash;
        }
        if (order != QStringList({ "a", "b", "c" })) {
            qCritical() << "Unexpected dequeue order:" << order;
            return 1;
        }
    }

    {
        qInfo() << "\n--- Test 4: empty dequeue and removal ---";

        WaitList list;
        WaitEntry entry;
        const OperationResult empty = list.dequeueNext(entry);
        if (empty.ok || empty.code != ErrorCode::WaitListEmpty || empty.error != "Wait list empty") {
            qCritical() << "Expected WaitListEmpty, got" << empty.error;
            return 1;
        }

        list.enqueue("a", TaskKind::Magnet);
        list.enqueue("b", TaskKind::Magnet);
        list.enqueue("c", TaskKind::Magnet);
        list.remove("b");
        list.remove("missing");

        if (list.contains("b") || !list.contains("a") || list.size() != 2) {
            qCritical() << "Removal did not drop exactly the requested entry";
            return 1;
        }

        const QVector<WaitEntry> entries = list.entries();
        if (entries.size() != 2 || entries.at(0).infoHash != "a" || entries.at(1).infoHash != "c") {
            qCritical() << "Unexpected entries after removal";
            return 1;
        }

        list.clear();
        if (list.size() != 0) {
            qCritical() << "Clear left entries behind";
            return 1;
        }
    }

    qInfo() << "\nAll wait list tests PASSED";
    return 0;
}
