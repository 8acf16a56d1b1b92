#include <gtest/gtest.h>

#include <chrono>
#include <sstream>
#include <string>

#include "FakeStorage.hpp"
#include "TempDirectory.hpp"

#include "ObjectInfo.hpp"
#include "UploadTask.hpp"

using namespace std::chrono_literals;

namespace {
	constexpr int kPreconditionFailedCode = 9;

	UploadConfig MakeConfig(bool skip_if_exists)
	{
		UploadConfig config;
		config.bucket = "bucket";
		config.skip_if_exists = skip_if_exists;
		return config;
	}

	TransferError AlreadyExists()
	{
		return TransferError::PreconditionFailed(kPreconditionFailedCode, "object already exists");
	}

	TransferError Unavailable()
	{
		return TransferError::Backend(14, "connection reset");
	}

	void ExpectFailedWith(const UploadResult& result, ErrorKind kind)
	{
		EXPECT_EQ(result.GetStatus(), TransferStatus::FailedToFinish);
		EXPECT_FALSE(result.GetUploadedObject().has_value());
		ASSERT_TRUE(result.GetError().has_value());
		EXPECT_EQ(result.GetError()->kind, kind) << result.GetError()->ToString();
	}
}

TEST(UploadTaskTest, StreamUploadSucceeds)
{
	FakeBackend backend;
	FakeStorageClient client(backend);

	std::istringstream stream("0123456789");
	UploadTask task(client, MakeObjectInfo("bucket", "obj1"), DataSource::FromStream(stream), MakeConfig(false));

	const UploadResult result = task.Execute();

	EXPECT_EQ(result.GetStatus(), TransferStatus::Success);
	ASSERT_TRUE(result.GetUploadedObject().has_value());
	EXPECT_FALSE(result.GetError().has_value());
	EXPECT_EQ(result.GetUploadedObject()->name(), "obj1");
	EXPECT_EQ(result.GetUploadedObject()->size(), 10u);
	EXPECT_EQ(result.GetSourceObject().name(), "obj1");

	EXPECT_EQ(backend.received, "0123456789");
	EXPECT_EQ(backend.close_calls, 1);
	EXPECT_EQ(backend.abort_calls, 0);
	EXPECT_EQ(backend.awaits, 1);
}

TEST(UploadTaskTest, StreamWithFailbitExceptionsSucceeds)
{
	FakeBackend backend;
	FakeStorageClient client(backend);

	std::istringstream stream("0123456789");
	stream.exceptions(std::ios::failbit | std::ios::badbit);

	UploadTask task(client, MakeObjectInfo("bucket", "obj1"), DataSource::FromStream(stream), MakeConfig(false));
	const UploadResult result = task.Execute();

	ASSERT_EQ(result.GetStatus(), TransferStatus::Success)
		<< (result.GetError() ? result.GetError()->ToString() : "");
	EXPECT_EQ(backend.received, "0123456789");
	EXPECT_EQ(backend.close_calls, 1);
	EXPECT_EQ(backend.abort_calls, 0);
}

TEST(UploadTaskTest, FileUploadSucceeds)
{
	TempDirectory dir;
	const auto path = dir.WriteFile("a.txt", std::string(100000, 'a'));

	FakeBackend backend;
	FakeStorageClient client(backend);

	UploadConfig config = MakeConfig(false);
	config.chunk_size = 4096;

	UploadTask task(client, MakeObjectInfo("bucket", "a.txt"), DataSource::FromPath(path), config);
	const UploadResult result = task.Execute();

	EXPECT_EQ(result.GetStatus(), TransferStatus::Success);
	EXPECT_EQ(backend.received, std::string(100000, 'a'));
	EXPECT_EQ(backend.writes, 25);
	EXPECT_EQ(backend.Releases(), 1);
}

TEST(UploadTaskTest, CompletionWithinBoundSucceeds)
{
	FakeBackend backend;
	backend.completion = FakeBackend::Completion::Delay;
	backend.completion_delay = 20ms;
	FakeStorageClient client(backend);

	UploadConfig config = MakeConfig(false);
	config.finalize_timeout = 2s;

	std::istringstream stream("payload");
	UploadTask task(client, MakeObjectInfo("bucket", "obj1"), DataSource::FromStream(stream), config);

	EXPECT_EQ(task.Execute().GetStatus(), TransferStatus::Success);
}

TEST(UploadTaskTest, ExistingObjectIsSkippedWhenSkipEnabled)
{
	TempDirectory dir;
	const auto path = dir.WriteFile("a.txt", "hello");

	FakeBackend backend;
	backend.open_sink_error = AlreadyExists();
	FakeStorageClient client(backend);

	UploadTask task(client, MakeObjectInfo("bucket", "obj2"), DataSource::FromPath(path), MakeConfig(true),
			{ WriteOption::DoesNotExist() });
	const UploadResult result = task.Execute();

	EXPECT_EQ(result.GetStatus(), TransferStatus::Skipped);
	EXPECT_FALSE(result.GetUploadedObject().has_value());
	ASSERT_TRUE(result.GetError().has_value());
	EXPECT_EQ(result.GetError()->kind, ErrorKind::PreconditionFailed);
	EXPECT_EQ(result.GetError()->code, kPreconditionFailedCode);
	EXPECT_EQ(backend.results_requested, 0);
}

TEST(UploadTaskTest, ExistingObjectFailsWhenSkipDisabled)
{
	TempDirectory dir;
	const auto path = dir.WriteFile("a.txt", "hello");

	FakeBackend backend;
	backend.open_sink_error = AlreadyExists();
	FakeStorageClient client(backend);

	UploadTask task(client, MakeObjectInfo("bucket", "obj2"), DataSource::FromPath(path), MakeConfig(false),
			{ WriteOption::DoesNotExist() });

	ExpectFailedWith(task.Execute(), ErrorKind::PreconditionFailed);
}

TEST(UploadTaskTest, PreconditionFailureWhileWritingIsSkipped)
{
	FakeBackend backend;
	backend.write_error = AlreadyExists();
	backend.fail_on_write = 1;
	FakeStorageClient client(backend);

	UploadConfig config = MakeConfig(true);
	config.chunk_size = 2;

	std::istringstream stream("abcdef");
	UploadTask task(client, MakeObjectInfo("bucket", "obj"), DataSource::FromStream(stream), config);
	const UploadResult result = task.Execute();

	EXPECT_EQ(result.GetStatus(), TransferStatus::Skipped);
	EXPECT_EQ(backend.received, "ab");
	EXPECT_EQ(backend.results_requested, 0);
}

TEST(UploadTaskTest, PreconditionFailureOnCloseIsSkipped)
{
	FakeBackend backend;
	backend.close_error = AlreadyExists();
	FakeStorageClient client(backend);

	std::istringstream stream("abc");
	UploadTask task(client, MakeObjectInfo("bucket", "obj"), DataSource::FromStream(stream), MakeConfig(true));

	EXPECT_EQ(task.Execute().GetStatus(), TransferStatus::Skipped);
	EXPECT_EQ(backend.close_calls, 1);
	EXPECT_EQ(backend.abort_calls, 0);
}

TEST(UploadTaskTest, PreconditionFailureOnSessionOpenFollowsSkipPolicy)
{
	for (const bool skip : { true, false }) {
		FakeBackend backend;
		backend.open_session_error = AlreadyExists();
		FakeStorageClient client(backend);

		std::istringstream stream("abc");
		UploadTask task(client, MakeObjectInfo("bucket", "obj"), DataSource::FromStream(stream), MakeConfig(skip));

		EXPECT_EQ(task.Execute().GetStatus(), skip ? TransferStatus::Skipped : TransferStatus::FailedToFinish);
	}
}

TEST(UploadTaskTest, BackendFaultsFailRegardlessOfSkipPolicy)
{
	for (const bool skip : { true, false }) {
		{
			FakeBackend backend;
			backend.open_session_error = Unavailable();
			FakeStorageClient client(backend);
			std::istringstream stream("abc");
			UploadTask task(client, MakeObjectInfo("bucket", "obj"), DataSource::FromStream(stream), MakeConfig(skip));
			ExpectFailedWith(task.Execute(), ErrorKind::Backend);
		}
		{
			FakeBackend backend;
			backend.open_sink_error = Unavailable();
			FakeStorageClient client(backend);
			std::istringstream stream("abc");
			UploadTask task(client, MakeObjectInfo("bucket", "obj"), DataSource::FromStream(stream), MakeConfig(skip));
			ExpectFailedWith(task.Execute(), ErrorKind::Backend);
		}
		{
			FakeBackend backend;
			backend.write_error = Unavailable();
			FakeStorageClient client(backend);
			std::istringstream stream("abc");
			UploadTask task(client, MakeObjectInfo("bucket", "obj"), DataSource::FromStream(stream), MakeConfig(skip));
			ExpectFailedWith(task.Execute(), ErrorKind::Backend);
			EXPECT_EQ(backend.close_calls, 0);
			EXPECT_EQ(backend.results_requested, 0);
		}
		{
			FakeBackend backend;
			backend.close_error = Unavailable();
			FakeStorageClient client(backend);
			std::istringstream stream("abc");
			UploadTask task(client, MakeObjectInfo("bucket", "obj"), DataSource::FromStream(stream), MakeConfig(skip));
			ExpectFailedWith(task.Execute(), ErrorKind::Backend);
			EXPECT_EQ(backend.results_requested, 0);
			EXPECT_EQ(backend.Releases(), 1);
		}
	}
}

TEST(UploadTaskTest, CompletionTimeoutFails)
{
	FakeBackend backend;
	backend.completion = FakeBackend::Completion::Hang;
	FakeStorageClient client(backend);

	UploadConfig config = MakeConfig(false);
	config.finalize_timeout = 50ms;

	std::istringstream stream("abc");
	UploadTask task(client, MakeObjectInfo("bucket", "obj"), DataSource::FromStream(stream), config);

	const auto start = std::chrono::steady_clock::now();
	const UploadResult result = task.Execute();
	const auto elapsed = std::chrono::steady_clock::now() - start;

	ExpectFailedWith(result, ErrorKind::Timeout);
	EXPECT_EQ(backend.last_timeout, 50ms);
	EXPECT_LT(elapsed, 5s);
}

TEST(UploadTaskTest, SlowCompletionBeyondBoundFails)
{
	FakeBackend backend;
	backend.completion = FakeBackend::Completion::Delay;
	backend.completion_delay = 10s;
	FakeStorageClient client(backend);

	UploadConfig config = MakeConfig(false);
	config.finalize_timeout = 30ms;

	std::istringstream stream("abc");
	UploadTask task(client, MakeObjectInfo("bucket", "obj"), DataSource::FromStream(stream), config);

	ExpectFailedWith(task.Execute(), ErrorKind::Timeout);
}

TEST(UploadTaskTest, DefaultBoundIsTenSeconds)
{
	FakeBackend backend;
	FakeStorageClient client(backend);

	UploadConfig config;
	EXPECT_EQ(config.finalize_timeout, 10s);

	std::istringstream stream("abc");
	UploadTask task(client, MakeObjectInfo("bucket", "obj"), DataSource::FromStream(stream), config);
	ASSERT_EQ(task.Execute().GetStatus(), TransferStatus::Success);
	EXPECT_EQ(backend.last_timeout, 10s);
}

TEST(UploadTaskTest, CompletionFaultsFailEvenWithSkip)
{
	const TransferError faults[] = {
		TransferError::Cancelled("interrupted"),
		TransferError::InvalidArgument("session was not closed"),
		TransferError::Backend(15, "data loss"),
		AlreadyExists(),
	};

	for (const TransferError& fault : faults) {
		FakeBackend backend;
		backend.completion = FakeBackend::Completion::Fail;
		backend.completion_error = fault;
		FakeStorageClient client(backend);

		std::istringstream stream("abc");
		UploadTask task(client, MakeObjectInfo("bucket", "obj"), DataSource::FromStream(stream), MakeConfig(true));

		ExpectFailedWith(task.Execute(), fault.kind);
	}
}

TEST(UploadTaskTest, EmptySourceFailsWithInvalidArgument)
{
	FakeBackend backend;
	FakeStorageClient client(backend);

	UploadTask task(client, MakeObjectInfo("bucket", "obj"), DataSource{}, MakeConfig(true));
	const UploadResult result = task.Execute();

	ExpectFailedWith(result, ErrorKind::InvalidArgument);
	EXPECT_EQ(backend.close_calls, 0);
	EXPECT_EQ(backend.abort_calls, 1);
	EXPECT_EQ(backend.results_requested, 0);
}

TEST(UploadTaskTest, MissingFileFailsWithIoError)
{
	TempDirectory dir;

	FakeBackend backend;
	FakeStorageClient client(backend);

	UploadTask task(client, MakeObjectInfo("bucket", "obj"), DataSource::FromPath(dir.Path() / "missing"), MakeConfig(false));

	ExpectFailedWith(task.Execute(), ErrorKind::Io);
	EXPECT_EQ(backend.Releases(), 1);
	EXPECT_EQ(backend.abort_calls, 1);
}

TEST(UploadTaskTest, ExceptionWhileDrainingIsCaughtAndSinkReleased)
{
	FakeBackend backend;
	FakeStorageClient client(backend);

	ThrowingStreamBuf buf(5);
	std::istream stream(&buf);
	stream.exceptions(std::ios::badbit);

	UploadConfig config = MakeConfig(true);
	config.chunk_size = 2;

	UploadTask task(client, MakeObjectInfo("bucket", "obj"), DataSource::FromStream(stream), config);
	const UploadResult result = task.Execute();

	ExpectFailedWith(result, ErrorKind::Internal);
	EXPECT_NE(result.GetError()->message.find("device unplugged"), std::string::npos);
	EXPECT_EQ(backend.received, "xxxx");
	EXPECT_EQ(backend.close_calls, 0);
	EXPECT_EQ(backend.abort_calls, 1);
}

TEST(UploadTaskTest, BrokenStreamFailsWithIoError)
{
	FakeBackend backend;
	FakeStorageClient client(backend);

	ThrowingStreamBuf buf(3);
	std::istream stream(&buf);

	UploadTask task(client, MakeObjectInfo("bucket", "obj"), DataSource::FromStream(stream), MakeConfig(false));

	ExpectFailedWith(task.Execute(), ErrorKind::Io);
	EXPECT_EQ(backend.Releases(), 1);
}

TEST(UploadTaskTest, MissingSessionPartsFailInternally)
{
	IncompleteStorageClient client;

	std::istringstream stream("abc");
	UploadTask task(client, MakeObjectInfo("bucket", "obj"), DataSource::FromStream(stream), MakeConfig(false));

	ExpectFailedWith(task.Execute(), ErrorKind::Internal);
}

TEST(UploadTaskTest, SecondExecuteFailsWithoutTouchingStorage)
{
	FakeBackend backend;
	FakeStorageClient client(backend);

	std::istringstream stream("abc");
	UploadTask task(client, MakeObjectInfo("bucket", "obj"), DataSource::FromStream(stream), MakeConfig(false));

	ASSERT_EQ(task.Execute().GetStatus(), TransferStatus::Success);

	ExpectFailedWith(task.Execute(), ErrorKind::InvalidArgument);
	EXPECT_EQ(backend.sessions_opened, 1);
	EXPECT_EQ(backend.Releases(), 1);
}

TEST(UploadTaskTest, ObjectAndOptionsArePassedThrough)
{
	FakeBackend backend;
	FakeStorageClient client(backend);

	ObjectInfo object = MakeObjectInfo("bucket", "dir/obj");
	(*object.mutable_metadata())["owner"] = "alice";

	const WriteOptions options{ WriteOption::IfGenerationMatch(42), WriteOption::ContentType("text/plain") };

	std::istringstream stream("abc");
	UploadTask task(client, object, DataSource::FromStream(stream), MakeConfig(false), options);
	const UploadResult result = task.Execute();

	ASSERT_EQ(result.GetStatus(), TransferStatus::Success);
	EXPECT_EQ(backend.last_object.name(), "dir/obj");
	EXPECT_EQ(backend.last_object.metadata().at("owner"), "alice");
	EXPECT_EQ(backend.last_options, options.ToString());
	EXPECT_EQ(result.GetSourceObject().metadata().at("owner"), "alice");
}
