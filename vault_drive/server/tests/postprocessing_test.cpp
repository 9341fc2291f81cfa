#include "test_support.hpp"

#include "events.hpp"
#include "postprocessing_driver.hpp"
#include "task_executor.hpp"
#include "tracer.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <sstream>

namespace vault::server::test {

namespace {

void write_text(Upload& upload, const std::string& text) {
    std::istringstream in(text);
    IstreamSource source(in);
    upload.write_chunk(upload.session().offset, source);
}

EngineOptions async_options() {
    EngineOptions options;
    options.async = true;
    return options;
}

}  // namespace

class PostprocessingTest : public EngineFixture {};

TEST_F(PostprocessingTest, BytesReceivedTriggersPostprocessing) {
    LocalEventBus bus;
    auto& eng = engine(async_options(), &bus);
    PostprocessingDriver driver(eng, *logger_, 2);
    driver.attach(bus);

    auto upload = eng.new_upload(request("a.txt", 5));
    write_text(*upload, "hello");
    upload->finish_upload();
    driver.wait_idle();

    const auto node = tree_->find_child(root_.space_id, docs_.id, "a.txt");
    ASSERT_TRUE(node.has_value());
    EXPECT_EQ(tree_->attributes(*node).count(attrs::kProcessing), 0u);
    EXPECT_EQ(read_all(*tree_->read_blob(*node)), "hello");
    EXPECT_FALSE(sessions_->load(upload->session().id).has_value());
    EXPECT_FALSE(std::filesystem::exists(upload->session().bin_path));
    EXPECT_EQ(tree_->get_md(docs_).size, 5);
}

TEST_F(PostprocessingTest, ResumesUploadsLeftPending) {
    auto& eng = engine(async_options());
    auto first = eng.new_upload(request("a.txt", 3));
    write_text(*first, "abc");
    first->finish_upload();
    auto second = eng.new_upload(request("b.txt", 3));
    write_text(*second, "def");
    second->finish_upload();
    ASSERT_EQ(eng.pending_postprocessing().size(), 2u);

    PostprocessingDriver driver(eng, *logger_, 1);
    EXPECT_EQ(driver.resume_pending(), 2u);
    driver.wait_idle();

    EXPECT_TRUE(eng.pending_postprocessing().empty());
    EXPECT_EQ(read_all(*tree_->read_blob(*tree_->find_child(root_.space_id, docs_.id, "b.txt"))), "def");
}

TEST_F(PostprocessingTest, FailedRunIsLoggedAndForgotten) {
    auto& eng = engine(async_options());
    PostprocessingDriver driver(eng, *logger_, 1);
    driver.schedule("no-such-upload");
    driver.wait_idle();
    EXPECT_NE(read_file(dir_.path() / "test.log").find("no-such-upload"), std::string::npos);
}

TEST(TaskExecutorTest, RunsTasksAndReportsErrors) {
    std::atomic<int> ran{0};
    std::atomic<int> failed{0};
    TaskExecutor executor(3, [&failed](const std::exception&) { ++failed; });
    for (int i = 0; i < 20; ++i) {
        executor.submit([&ran, i]() {
            ++ran;
            if (i % 5 == 0) {
                throw std::runtime_error("boom");
            }
        });
    }
    executor.wait_idle();
    EXPECT_EQ(ran.load(), 20);
    EXPECT_EQ(failed.load(), 4);

    executor.shutdown();
    EXPECT_THROW(executor.submit([] {}), std::runtime_error);
}

TEST(LocalEventBusTest, DeliversToEverySubscriber) {
    LocalEventBus bus;
    int calls = 0;
    std::string seen;
    bus.subscribe([&](const BytesReceived& event) {
        ++calls;
        seen = event.upload_id;
    });
    bus.subscribe([&](const BytesReceived&) { ++calls; });
    BytesReceived event;
    event.upload_id = "u1";
    bus.publish(event);
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(seen, "u1");
}

TEST(TracerTest, SpanReportsOnceOnEnd) {
    int ended = 0;
    {
        Span span("work", [&ended](const std::string& name, std::chrono::microseconds) {
            EXPECT_EQ(name, "work");
            ++ended;
        });
        Span moved = std::move(span);
        moved.end();
    }
    EXPECT_EQ(ended, 1);

    NullTracer tracer;
    auto span = tracer.start_span("noop");
    EXPECT_EQ(span.name(), "noop");
}

}  // namespace vault::server::test
