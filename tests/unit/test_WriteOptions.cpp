#include <gtest/gtest.h>

#include <variant>

#include "WriteOptions.hpp"

TEST(WriteOptionsTest, FactoriesCarryTheirValues)
{
	EXPECT_EQ(WriteOption::DoesNotExist().GetKind(), WriteOption::Kind::DoesNotExist);

	const WriteOption match = WriteOption::IfGenerationMatch(7);
	EXPECT_EQ(match.GetKind(), WriteOption::Kind::IfGenerationMatch);
	EXPECT_EQ(match.GetGeneration(), 7);

	const WriteOption not_match = WriteOption::IfGenerationNotMatch(8);
	EXPECT_EQ(not_match.GetKind(), WriteOption::Kind::IfGenerationNotMatch);
	EXPECT_EQ(not_match.GetGeneration(), 8);

	const WriteOption checksum = WriteOption::Checksum(HASH_TYPE_SHA512);
	EXPECT_EQ(checksum.GetKind(), WriteOption::Kind::Checksum);
	EXPECT_EQ(checksum.GetHashType(), HASH_TYPE_SHA512);

	const WriteOption content = WriteOption::ContentType("application/json");
	EXPECT_EQ(content.GetKind(), WriteOption::Kind::ContentType);
	EXPECT_EQ(content.GetContentType(), "application/json");
}

TEST(WriteOptionsTest, WrongGetterThrows)
{
	EXPECT_THROW(WriteOption::DoesNotExist().GetGeneration(), std::bad_variant_access);
	EXPECT_THROW(WriteOption::ContentType("text/plain").GetHashType(), std::bad_variant_access);
}

TEST(WriteOptionsTest, ToStringListsOptionsInOrder)
{
	WriteOptions options;
	EXPECT_TRUE(options.IsEmpty());
	EXPECT_EQ(options.ToString(), "[]");

	options.Add(WriteOption::DoesNotExist()).Add(WriteOption::IfGenerationMatch(3));
	options.Add(WriteOption::Checksum(HASH_TYPE_SHA256));
	options.Add(WriteOption::ContentType("text/plain"));

	EXPECT_FALSE(options.IsEmpty());
	EXPECT_EQ(options.GetOptions().size(), 4u);
	EXPECT_EQ(options.ToString(),
		  "[does-not-exist, if-generation-match=3, checksum=HASH_TYPE_SHA256, content-type=text/plain]");
}

TEST(WriteOptionsTest, InitializerList)
{
	const WriteOptions options{ WriteOption::IfGenerationNotMatch(0), WriteOption::Checksum(HASH_TYPE_UNSPECIFIED) };

	ASSERT_EQ(options.GetOptions().size(), 2u);
	EXPECT_EQ(options.GetOptions()[0].GetKind(), WriteOption::Kind::IfGenerationNotMatch);
	EXPECT_EQ(options.ToString(), "[if-generation-not-match=0, checksum=HASH_TYPE_UNSPECIFIED]");
}
