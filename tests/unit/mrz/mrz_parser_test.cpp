#include <docscan/core/error.hpp>
#include <docscan/core/mrz_record.hpp>
#include <docscan/core/scan_observer.hpp>
#include <docscan/mrz/mrz_parser.hpp>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace dc = docscan::core;
namespace dm = docscan::mrz;

namespace {

const std::string kTd3Line1 = "P<UTOERIKSSON<<ANNA<MARIA<<<<<<<<<<<<<<<<<<<";
const std::string kTd3Line2 = "L898902C36UTO7408122F1204159ZE184226B<<<<<10";

const std::string kTd2Line1 = "I<UTOERIKSSON<<ANNA<MARIA<<<<<<<<<<<";
const std::string kTd2Line2 = "D231458907UTO7408122F1204159<<<<<<<6";

const std::string kTd1Line1 = "I<UTOD231458907<<<<<<<<<<<<<<<";
const std::string kTd1Line2 = "7408122F1204159UTO<<<<<<<<<<<6";
const std::string kTd1Line3 = "ERIKSSON<<ANNA<MARIA<<<<<<<<<<";

std::vector<std::string> lines_of(std::size_t count, std::size_t width) {
  return std::vector<std::string>(count, std::string(width, 'A'));
}

}  // namespace

TEST(MrzParser, ParsesPassport) {
  const auto record = dm::MrzParser().parse(kTd3Line1 + "\n" + kTd3Line2);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->format, dc::MrzFormat::TD3);
  EXPECT_EQ(record->issuing_country, "UTO");
  EXPECT_EQ(record->surname, "ERIKSSON");
  EXPECT_EQ(record->given_names, "ANNA MARIA");
  EXPECT_EQ(record->document_number, "L898902C3");
  EXPECT_EQ(record->nationality, "UTO");
  EXPECT_EQ(record->date_of_birth, "740812");
  EXPECT_EQ(record->sex, "F");
  EXPECT_EQ(record->date_of_expiry, "120415");
  EXPECT_EQ(record->optional_data, "ZE184226B");
  EXPECT_FLOAT_EQ(record->confidence, 0.75f);
  ASSERT_EQ(record->raw_lines.size(), 2u);
  EXPECT_EQ(record->raw_lines[0].size(), 44u);
  EXPECT_EQ(record->raw_lines[1].size(), 44u);
}

TEST(MrzParser, ParsesOfficialDocument) {
  const auto record = dm::MrzParser().parse(kTd2Line1 + "\n" + kTd2Line2);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->format, dc::MrzFormat::TD2);
  EXPECT_EQ(record->issuing_country, "UTO");
  EXPECT_EQ(record->surname, "ERIKSSON");
  EXPECT_EQ(record->given_names, "ANNA MARIA");
  EXPECT_EQ(record->document_number, "D23145890");
  EXPECT_EQ(record->nationality, "UTO");
  EXPECT_EQ(record->date_of_birth, "740812");
  EXPECT_EQ(record->sex, "F");
  EXPECT_EQ(record->date_of_expiry, "120415");
  EXPECT_EQ(record->optional_data, "");
  EXPECT_EQ(record->raw_lines[0].size(), 36u);
}

TEST(MrzParser, ParsesIdCard) {
  const auto record =
      dm::MrzParser().parse(kTd1Line1 + "\n" + kTd1Line2 + "\n" + kTd1Line3);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->format, dc::MrzFormat::TD1);
  EXPECT_EQ(record->issuing_country, "UTO");
  EXPECT_EQ(record->document_number, "D23145890");
  EXPECT_EQ(record->optional_data, "");
  EXPECT_EQ(record->date_of_birth, "740812");
  EXPECT_EQ(record->sex, "F");
  EXPECT_EQ(record->date_of_expiry, "120415");
  EXPECT_EQ(record->nationality, "UTO");
  EXPECT_EQ(record->surname, "ERIKSSON");
  EXPECT_EQ(record->given_names, "ANNA MARIA");
  ASSERT_EQ(record->raw_lines.size(), 3u);
  EXPECT_EQ(record->raw_lines[2].size(), 30u);
}

TEST(MrzParser, NormalizesSpacingCaseAndNoise) {
  const std::string text = "  p<uto eriksson<<anna<maria<<<<<<<<<<<<<<<<<<<  \r\n"
                           "noise\n"
                           "\n" +
                           kTd3Line2 + "\n";
  const auto record = dm::MrzParser().parse(text);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->format, dc::MrzFormat::TD3);
  EXPECT_EQ(record->surname, "ERIKSSON");
  EXPECT_EQ(record->given_names, "ANNA MARIA");
}

TEST(MrzParser, ReadsDigitZeroInNamesAsLetter) {
  const std::string line1 = dm::fit_line("P<UTOSMITH<<J0HN", 44);
  const auto record = dm::MrzParser().parse(line1 + "\n" + kTd3Line2);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->surname, "SMITH");
  EXPECT_EQ(record->given_names, "JOHN");
}

TEST(MrzParser, CorrectsLetterOInBirthDateOnly) {
  std::string line2 = kTd3Line2;
  line2[15] = 'O';  // date of birth 74O812
  line2[23] = 'O';  // date of expiry 12O415
  const auto record = dm::MrzParser().parse(kTd3Line1 + "\n" + line2);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->date_of_birth, "740812");
  EXPECT_EQ(record->date_of_expiry, "12O415");
}

TEST(MrzParser, ShortLinesPaddedWithFiller) {
  const auto record = dm::MrzParser().parse(kTd3Line1 + "\nL898902C36UTO7408122F1204159");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->raw_lines[1].size(), 44u);
  EXPECT_EQ(record->raw_lines[1].back(), dm::kFiller);
  EXPECT_EQ(record->date_of_expiry, "120415");
  EXPECT_EQ(record->optional_data, "");
}

TEST(MrzParser, LongLinesTruncated) {
  const auto record = dm::MrzParser().parse(kTd3Line1 + "XXXXXX\n" + kTd3Line2 + "YYYY");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->raw_lines[0], kTd3Line1);
  EXPECT_EQ(record->raw_lines[1], kTd3Line2);
}

TEST(MrzParser, NoUsableLines) {
  const auto empty = dm::MrzParser().parse("");
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error().kind, dc::ErrorKind::NoValidLines);

  const auto noise = dm::MrzParser().parse("short\nlines only\n");
  ASSERT_FALSE(noise.has_value());
  EXPECT_EQ(noise.error().kind, dc::ErrorKind::NoValidLines);
}

TEST(MrzParser, UnsupportedLineCountReportsCount) {
  const auto one = dm::MrzParser().parse(kTd3Line1);
  ASSERT_FALSE(one.has_value());
  EXPECT_EQ(one.error().kind, dc::ErrorKind::UnsupportedLineCount);
  EXPECT_EQ(one.error().actual, 1u);

  const auto four = dm::MrzParser().parse(kTd1Line1 + "\n" + kTd1Line2 + "\n" + kTd1Line3 +
                                          "\n" + kTd1Line3);
  ASSERT_FALSE(four.has_value());
  EXPECT_EQ(four.error().actual, 4u);
}

TEST(MrzParser, MinLineLengthConfigurable) {
  dm::MrzParserOptions options;
  options.min_line_length = 40;
  // The 36-character TD2 lines are dropped as noise.
  const auto record = dm::MrzParser(options).parse(kTd2Line1 + "\n" + kTd2Line2);
  ASSERT_FALSE(record.has_value());
  EXPECT_EQ(record.error().kind, dc::ErrorKind::NoValidLines);
}

TEST(MrzParser, ObserverSeesNormalizationAndFormat) {
  std::vector<dc::ScanEvent> events;
  dm::MrzParser parser({}, [&](const dc::ScanEvent& e) { events.push_back(e); });
  ASSERT_TRUE(parser.parse(kTd3Line1 + "\n" + kTd3Line2).has_value());

  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].kind, dc::ScanEventKind::MrzLinesNormalized);
  EXPECT_EQ(events[0].count, 2u);
  EXPECT_EQ(events[1].kind, dc::ScanEventKind::MrzClassified);
  EXPECT_EQ(events[1].detail, "TD3");
}

TEST(MrzFormatClassification, ByLineCountAndWidth) {
  EXPECT_EQ(dm::classify_format(lines_of(3, 30)).value(), dc::MrzFormat::TD1);
  EXPECT_EQ(dm::classify_format(lines_of(2, 44)).value(), dc::MrzFormat::TD3);
  EXPECT_EQ(dm::classify_format(lines_of(2, 40)).value(), dc::MrzFormat::TD3);
  EXPECT_EQ(dm::classify_format(lines_of(2, 39)).value(), dc::MrzFormat::TD2);
  EXPECT_EQ(dm::classify_format(lines_of(2, 36)).value(), dc::MrzFormat::TD2);

  const auto none = dm::classify_format({});
  ASSERT_FALSE(none.has_value());
  EXPECT_EQ(none.error().kind, dc::ErrorKind::UnsupportedLineCount);
  EXPECT_EQ(none.error().actual, 0u);
}

TEST(MrzFormatClassification, LineWidths) {
  EXPECT_EQ(dm::line_width(dc::MrzFormat::TD1), 30u);
  EXPECT_EQ(dm::line_width(dc::MrzFormat::TD2), 36u);
  EXPECT_EQ(dm::line_width(dc::MrzFormat::TD3), 44u);
}

TEST(MrzFields, FitLine) {
  EXPECT_EQ(dm::fit_line("ABC", 5), "ABC<<");
  EXPECT_EQ(dm::fit_line("ABCDEFG", 5), "ABCDE");
  EXPECT_EQ(dm::fit_line("", 3), "<<<");
}

TEST(MrzFields, ExtractFieldClamps) {
  EXPECT_EQ(dm::extract_field("ABCDEFGH", 2, 5), "CDE");
  EXPECT_EQ(dm::extract_field("ABCDEFGH", 6, 20), "GH");
  EXPECT_EQ(dm::extract_field("ABCDEFGH", 8, 10), "");
  EXPECT_EQ(dm::extract_field("ABCDEFGH", 30, 40), "");
}

TEST(MrzFields, SplitNames) {
  auto [surname, given] = dm::split_names("VAN<DER<BERG<<JAN<PIETER<<<<");
  EXPECT_EQ(surname, "VAN DER BERG");
  EXPECT_EQ(given, "JAN PIETER");

  auto [only, none] = dm::split_names("MADONNA<<<<");
  EXPECT_EQ(only, "MADONNA");
  EXPECT_EQ(none, "");

  auto [mono, rest] = dm::split_names("PRINCE");
  EXPECT_EQ(mono, "PRINCE");
  EXPECT_EQ(rest, "");
}
