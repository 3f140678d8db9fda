#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "validator/import_validator.hpp"

namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::StartsWith;

using namespace validator;

class ImportValidatorTest : public ::testing::Test {
 protected:
  ImportValidatorTest()
      : validator_({"pandas", "numpy", "json", "os", "sys", "datetime"}) {}

  ImportValidator validator_;
};

TEST_F(ImportValidatorTest, TestNoImports) {
  std::string reason;
  EXPECT_TRUE(validator_.Validate("print('hi')\n", &reason));
  EXPECT_EQ(reason, "");
}

TEST_F(ImportValidatorTest, TestAllowedImports) {
  std::string reason;
  EXPECT_TRUE(validator_.Validate(
      "import os\n"
      "import json as j, sys\n"
      "import os.path\n"
      "from pandas import DataFrame as DF, Series\n"
      "from datetime import *\n",
      &reason))
      << reason;
}

TEST_F(ImportValidatorTest, TestDisallowedImport) {
  std::string reason;
  EXPECT_FALSE(validator_.Validate("import socket\n", &reason));
  EXPECT_EQ(reason, "disallowed import: socket");
}

TEST_F(ImportValidatorTest, TestDisallowedFromImport) {
  std::string reason;
  EXPECT_FALSE(validator_.Validate("from subprocess import run\n", &reason));
  EXPECT_EQ(reason, "disallowed import: subprocess");
}

TEST_F(ImportValidatorTest, TestDottedNameChecksRoot) {
  std::string reason;
  EXPECT_FALSE(validator_.Validate("import xml.etree.ElementTree\n", &reason));
  EXPECT_EQ(reason, "disallowed import: xml");
  EXPECT_FALSE(validator_.Validate("from urllib.request import urlopen\n",
                                   &reason));
  EXPECT_EQ(reason, "disallowed import: urllib");
}

TEST_F(ImportValidatorTest, TestSecondNameInList) {
  std::string reason;
  EXPECT_FALSE(validator_.Validate("import os, socket\n", &reason));
  EXPECT_EQ(reason, "disallowed import: socket");
}

TEST_F(ImportValidatorTest, TestNestedImport) {
  std::string reason;
  EXPECT_FALSE(validator_.Validate(
      "def f():\n"
      "    try:\n"
      "        import numpy\n"
      "    except ImportError:\n"
      "        import ctypes\n",
      &reason));
  EXPECT_EQ(reason, "disallowed import: ctypes");
}

TEST_F(ImportValidatorTest, TestImportAfterSemicolon) {
  std::string reason;
  EXPECT_FALSE(validator_.Validate("x = 1; import socket\n", &reason));
  EXPECT_EQ(reason, "disallowed import: socket");
}

TEST_F(ImportValidatorTest, TestImportInOneLineBlock) {
  std::string reason;
  EXPECT_FALSE(validator_.Validate("if True: import socket\n", &reason));
  EXPECT_EQ(reason, "disallowed import: socket");
}

TEST_F(ImportValidatorTest, TestImportsInStringsAndComments) {
  std::string reason;
  EXPECT_TRUE(validator_.Validate(
      "# import socket\n"
      "s = 'import socket'\n"
      "doc = \"\"\"\nfrom subprocess import run\n\"\"\"\n"
      "print(f\"{'import ctypes'}\")\n",
      &reason))
      << reason;
}

TEST_F(ImportValidatorTest, TestFromInOtherPositions) {
  std::string reason;
  EXPECT_TRUE(validator_.Validate(
      "def g():\n"
      "    yield from range(3)\n"
      "try:\n"
      "    pass\n"
      "except KeyError as e:\n"
      "    raise ValueError() from e\n",
      &reason))
      << reason;
}

TEST_F(ImportValidatorTest, TestParenthesizedImportList) {
  std::string reason;
  EXPECT_TRUE(validator_.Validate(
      "from os import (\n"
      "    path,\n"
      "    sep as separator,\n"
      ")\n",
      &reason))
      << reason;
}

TEST_F(ImportValidatorTest, TestRelativeImports) {
  std::vector<std::string> modules;
  std::string error_msg;
  ASSERT_TRUE(ImportValidator::ExtractImports(
      "from . import a\nfrom .. import b\nfrom .pkg import c\n"
      "from ...deep.mod import d\n",
      &modules, &error_msg))
      << error_msg;
  EXPECT_THAT(modules, ElementsAre("pkg", "deep"));
}

TEST_F(ImportValidatorTest, TestBareRelativeImportAllowed) {
  std::string reason;
  EXPECT_TRUE(validator_.Validate("from . import helpers\n", &reason))
      << reason;
}

TEST_F(ImportValidatorTest, TestExtractImportsOrder) {
  std::vector<std::string> modules;
  std::string error_msg;
  ASSERT_TRUE(ImportValidator::ExtractImports(
      "import b.x\nif x:\n    from a import y\nimport c as d, e\n", &modules,
      &error_msg));
  EXPECT_THAT(modules, ElementsAre("b", "a", "c", "e"));
}

TEST_F(ImportValidatorTest, TestExtractNoImports) {
  std::vector<std::string> modules;
  std::string error_msg;
  ASSERT_TRUE(ImportValidator::ExtractImports("", &modules, &error_msg));
  EXPECT_THAT(modules, IsEmpty());
}

TEST_F(ImportValidatorTest, TestUnparsableCodeRejected) {
  std::string reason;
  EXPECT_FALSE(validator_.Validate("print('hi'\n", &reason));
  EXPECT_EQ(reason, "syntax error: line 1: '(' was never closed");
}

TEST_F(ImportValidatorTest, TestMalformedImport) {
  std::string reason;
  EXPECT_FALSE(validator_.Validate("import (os)\n", &reason));
  EXPECT_THAT(reason, StartsWith("syntax error: line 1: "));
  EXPECT_FALSE(validator_.Validate("from os import\n", &reason));
  EXPECT_THAT(reason, StartsWith("syntax error: line 1: "));
  EXPECT_FALSE(validator_.Validate("from os import a,\n", &reason));
  EXPECT_THAT(reason, StartsWith("syntax error: line 1: "));
  EXPECT_FALSE(validator_.Validate("import os sys\n", &reason));
  EXPECT_THAT(reason, StartsWith("syntax error: line 1: "));
  EXPECT_FALSE(validator_.Validate("import class\n", &reason));
  EXPECT_THAT(reason, StartsWith("syntax error: line 1: "));
}

TEST_F(ImportValidatorTest, TestImportOutsideStatementPosition) {
  std::string reason;
  EXPECT_FALSE(validator_.Validate("x = import\n", &reason));
  EXPECT_EQ(reason, "syntax error: line 1: invalid syntax");
}

TEST_F(ImportValidatorTest, TestMissingIndentedBlock) {
  std::string reason;
  EXPECT_FALSE(validator_.Validate("if x:\nimport os\n", &reason));
  EXPECT_EQ(reason, "syntax error: line 2: expected an indented block");
  EXPECT_FALSE(validator_.Validate("for i in x:\n", &reason));
  EXPECT_THAT(reason, StartsWith("syntax error: "));
}

TEST_F(ImportValidatorTest, TestUnexpectedIndent) {
  std::string reason;
  EXPECT_FALSE(validator_.Validate("x = 1\n    import os\n", &reason));
  EXPECT_EQ(reason, "syntax error: line 2: unexpected indent");
  EXPECT_FALSE(validator_.Validate("  x = 1\n", &reason));
  EXPECT_EQ(reason, "syntax error: line 1: unexpected indent");
}

TEST_F(ImportValidatorTest, TestSyntaxErrorWinsOverDisallowedImport) {
  std::string reason;
  EXPECT_FALSE(validator_.Validate("import socket\nx = (\n", &reason));
  EXPECT_THAT(reason, StartsWith("syntax error: "));
}

TEST_F(ImportValidatorTest, TestNonUtf8SourceEncoding) {
  std::string reason;
  // In UTF-7, "+AAo-" decodes to a newline, so the import would run.
  EXPECT_FALSE(validator_.Validate(
      "# -*- coding: utf-7 -*-\n"
      "# +AAo-import socket; print(socket.__name__)\n"
      "print('ok')\n",
      &reason));
  EXPECT_EQ(reason, "syntax error: line 1: encoding problem: utf-7");
  EXPECT_FALSE(validator_.Validate(
      "#!/usr/bin/env python\n# -*- coding: latin-1 -*-\nimport os\n",
      &reason));
  EXPECT_EQ(reason, "syntax error: line 2: encoding problem: latin-1");
}

TEST_F(ImportValidatorTest, TestUtf8SourceEncoding) {
  std::string reason;
  EXPECT_TRUE(validator_.Validate("# coding: utf-8\nimport json\n", &reason))
      << reason;
  EXPECT_FALSE(validator_.Validate("# coding: utf8\nimport socket\n",
                                   &reason));
  EXPECT_EQ(reason, "disallowed import: socket");
}

TEST_F(ImportValidatorTest, TestAllowedModulesSorted) {
  EXPECT_THAT(validator_.AllowedModules(),
              ElementsAre("datetime", "json", "numpy", "os", "pandas", "sys"));
}

}  // namespace
