#include "../src/console_status_sink.h"
#include <cassert>
#include <iostream>

int main() {
    spider_log::setLevel(spider_log::LOG_WARNING);
    assert(spider_log::getLevel() == spider_log::LOG_WARNING);

    ConsoleStatusSink sink;
    assert(sink.getLastMode() == MODE_IDLE);

    sink.updateMode(MODE_DANCING);
    sink.updateDistance(42.0);
    assert(sink.getLastMode() == MODE_DANCING);
    assert(sink.getLastDistance() == 42.0);

    sink.updateMode(MODE_READY);
    assert(sink.getLastMode() == MODE_READY);

    std::cout << "console_status_sink_test executed successfully" << std::endl;
    return 0;
}
