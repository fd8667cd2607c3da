// File: tests/unit/test_scan_profile.cpp
// Purpose: Verify the structure and dependency profiles of a project tree.
// Key invariants: Lists are sorted or ranked with ties by name; ignored
//                 directories contribute nothing; missing manifests yield
//                 "unknown" rather than errors.
// Ownership/Lifetime: Each test owns one or more ProjectFixture directories.

#include <gtest/gtest.h>

#include "scan/ProjectProfile.hpp"
#include "support/logger.hpp"
#include "tests/common/ProjectFixture.hpp"

#include <string>
#include <utility>
#include <vector>

using namespace thymus::scan;
using thymus::support::Logger;
using thymus::tests::ProjectFixture;

namespace
{
using FileList = std::vector<std::pair<const char *, const char *>>;

std::string languageOf(const FileList &files)
{
    ProjectFixture project;
    for (const auto &[rel, content] : files)
        project.write(rel, content);
    return detectLanguage(project.root());
}
} // namespace

TEST(ProjectProfile, StructureSummarizesLayout)
{
    ProjectFixture project;
    project.write("src/routes/users.ts", "import { db } from '../db/client';\n");
    project.write("src/routes/users.test.ts", "test('x', () => {});\n");
    project.write("src/services/user.service.ts", "export {};\n");
    project.write("src/services/order.service.ts", "export {};\n");
    project.write("src/db/client.ts", "export const db = 1;\n");
    project.write("src/a/b/c/deep.ts", "export {};\n");
    project.write("node_modules/pkg/services/index.ts", "export {};\n");
    project.write("docs/guide.md", "# guide\n");
    project.write("README.md", "# readme\n");

    const StructureProfile profile = profileStructure(project.root(), Logger::null());

    const std::vector<std::string> dirs = {"docs",  "src",        "src/a",       "src/a/b",
                                           "src/db", "src/routes", "src/services"};
    EXPECT_EQ(profile.rawStructure, dirs);
    EXPECT_EQ(profile.detectedLayers, (std::vector<std::string>{"routes", "services", "db"}));
    EXPECT_EQ(profile.namingPatterns, (std::vector<std::string>{".service.ts", ".test.ts"}));

    const std::vector<std::string> gaps = {"src/a/b/c/deep.ts", "src/db/client.ts",
                                           "src/services/order.service.ts", "src/services/user.service.ts"};
    EXPECT_EQ(profile.testGaps, gaps);

    ASSERT_EQ(profile.fileCounts.size(), 2u);
    EXPECT_EQ(profile.fileCounts[0].dir, "docs");
    EXPECT_EQ(profile.fileCounts[0].count, 1u);
    EXPECT_EQ(profile.fileCounts[1].dir, "src");
    EXPECT_EQ(profile.fileCounts[1].count, 6u);
}

TEST(ProjectProfile, NamingPatternTiesRankByName)
{
    ProjectFixture project;
    project.write("src/b.controller.ts", "export {};\n");
    project.write("src/a.model.ts", "export {};\n");
    project.write("src/c.model.ts", "export {};\n");
    project.write("src/d.dto.ts", "export {};\n");

    const StructureProfile profile = profileStructure(project.root(), Logger::null());
    EXPECT_EQ(profile.namingPatterns, (std::vector<std::string>{".model.ts", ".controller.ts", ".dto.ts"}));
}

TEST(ProjectProfile, DetectsLanguageFromManifests)
{
    EXPECT_EQ(languageOf({{"package.json", "{}"}, {"tsconfig.json", "{}"}}), "typescript");
    EXPECT_EQ(languageOf({{"package.json", "{}"}, {"src/app/main.ts", ""}}), "typescript");
    EXPECT_EQ(languageOf({{"package.json", "{}"}, {"index.js", ""}}), "javascript");
    EXPECT_EQ(languageOf({{"requirements.txt", "flask\n"}}), "python");
    EXPECT_EQ(languageOf({{"go.mod", "module example.com/x\n"}}), "go");
    EXPECT_EQ(languageOf({{"Cargo.toml", "[package]\n"}}), "rust");
    EXPECT_EQ(languageOf({{"pom.xml", "<project/>"}}), "java");
    EXPECT_EQ(languageOf({{"build.gradle.kts", "plugins { kotlin(\"jvm\") }\n"}}), "kotlin");
    EXPECT_EQ(languageOf({{"pom.xml", "<project/>"}, {"src/main/kotlin/App.kt", ""}}), "kotlin");
    EXPECT_EQ(languageOf({{"pubspec.yaml", "name: app\n"}}), "dart");
    EXPECT_EQ(languageOf({{"Package.swift", "// swift-tools-version:5.9\n"}}), "swift");
    EXPECT_EQ(languageOf({{"App.xcodeproj/project.pbxproj", ""}}), "swift");
    EXPECT_EQ(languageOf({{"src/Api/Api.csproj", "<Project/>"}}), "csharp");
    EXPECT_EQ(languageOf({{"composer.json", "{}"}}), "php");
    EXPECT_EQ(languageOf({{"Gemfile", "source 'https://rubygems.org'\n"}}), "ruby");
    EXPECT_EQ(languageOf({{"notes.txt", ""}}), "unknown");
}

TEST(ProjectProfile, DetectsFrameworkPerLanguage)
{
    ProjectFixture js;
    js.write("package.json", R"({"dependencies": {"express": "^4", "next": "13"}})");
    EXPECT_EQ(detectFramework(js.root(), "javascript"), "nextjs");

    ProjectFixture py;
    py.write("requirements.txt", "fastapi==0.110\n");
    EXPECT_EQ(detectFramework(py.root(), "python"), "fastapi");

    ProjectFixture java;
    java.write("pom.xml", "<artifactId>spring-boot-starter-web</artifactId>\n");
    EXPECT_EQ(detectFramework(java.root(), "java"), "spring-boot");

    ProjectFixture php;
    php.write("composer.json", R"({"require": {"php": ">=8.1", "symfony/console": "6.4"}})");
    EXPECT_EQ(detectFramework(php.root(), "php"), "symfony");

    ProjectFixture ruby;
    ruby.write("Gemfile", "gem 'rails', '~> 7.1'\n");
    EXPECT_EQ(detectFramework(ruby.root(), "ruby"), "rails");

    ProjectFixture broken;
    broken.write("package.json", "{not json");
    EXPECT_EQ(detectFramework(broken.root(), "javascript"), "unknown");
    EXPECT_EQ(detectFramework(broken.root(), "cobol"), "unknown");
}

TEST(ProjectProfile, ExternalDependenciesFromManifests)
{
    ProjectFixture js;
    js.write("package.json",
             R"({"dependencies": {"react": "18", "axios": "1"}, "devDependencies": {"jest": "29"}})");
    EXPECT_EQ(externalDependencies(js.root(), "typescript"), (std::vector<std::string>{"axios", "jest", "react"}));

    ProjectFixture py;
    py.write("requirements.txt", "# pinned\nrequests>=2.0\nflask==2.3\n\nnumpy[extra]\n");
    EXPECT_EQ(externalDependencies(py.root(), "python"), (std::vector<std::string>{"requests", "flask", "numpy"}));

    ProjectFixture go;
    go.write("go.mod", "module github.com/acme/shop\n\ngo 1.21\n\nrequire (\n"
                       "\tgithub.com/gin-gonic/gin v1.9.1\n\tgithub.com/lib/pq v1.10.9\n)\n");
    EXPECT_EQ(externalDependencies(go.root(), "go"),
              (std::vector<std::string>{"github.com/gin-gonic/gin", "github.com/lib/pq"}));

    ProjectFixture maven;
    maven.write("pom.xml", "<project><dependencies>\n"
                           "  <dependency><groupId>org.springframework.boot</groupId>"
                           "<artifactId>spring-boot-starter-web</artifactId></dependency>\n"
                           "  <dependency>\n"
                           "    <groupId>junit</groupId>\n"
                           "    <artifactId>junit</artifactId>\n"
                           "    <version>4.13</version>\n"
                           "  </dependency>\n"
                           "</dependencies></project>\n");
    EXPECT_EQ(externalDependencies(maven.root(), "java"),
              (std::vector<std::string>{"org.springframework.boot:spring-boot-starter-web:managed",
                                        "junit:junit:4.13"}));

    ProjectFixture gradle;
    gradle.write("build.gradle", "dependencies {\n"
                                 "    implementation 'com.google.guava:guava:32.0'\n"
                                 "    testImplementation(\"junit:junit:4.13\")\n"
                                 "}\n");
    EXPECT_EQ(externalDependencies(gradle.root(), "java"),
              (std::vector<std::string>{"com.google.guava:guava:32.0", "junit:junit:4.13"}));

    ProjectFixture none;
    EXPECT_TRUE(externalDependencies(none.root(), "python").empty());
}

TEST(ProjectProfile, ImportFrequencyCountsInternalPaths)
{
    ProjectFixture project;
    project.write("src/a.ts", "import x from './util';\nimport y from '../lib/db';\nimport z from 'react';\n");
    project.write("src/b.ts", "import u from './util';\n");
    project.write("node_modules/m/index.js", "import u from './util';\n");

    const auto ranked = importFrequency(project.root(), "typescript", Logger::null());
    ASSERT_EQ(ranked.size(), 2u);
    EXPECT_EQ(ranked[0].path, "./util");
    EXPECT_EQ(ranked[0].count, 2u);
    EXPECT_EQ(ranked[1].path, "../lib/db");
    EXPECT_EQ(ranked[1].count, 1u);

    ProjectFixture py;
    py.write("app/views.py", "from .models import User\n    from .forms import Form\n");
    const auto pyRanked = importFrequency(py.root(), "python", Logger::null());
    ASSERT_EQ(pyRanked.size(), 1u);
    EXPECT_EQ(pyRanked[0].path, ".models");
}

TEST(ProjectProfile, CrossModuleImportsForScripts)
{
    ProjectFixture project;
    project.write("package.json", "{}");
    project.write("tsconfig.json", "{}");
    project.write("src/routes/users.ts", "import { db } from '../db/client';\n");
    project.write("src/db/client.ts", "import { log } from '../utils/log';\n");
    project.write("src/utils/log.ts", "export const log = 1;\n");

    const auto links = crossModuleImports(project.root(), "typescript", Logger::null());
    const std::vector<ModuleLink> expected = {{"db", "utils"}, {"routes", "db"}};
    EXPECT_EQ(links, expected);
}

TEST(ProjectProfile, CrossModuleImportsForGo)
{
    ProjectFixture project;
    project.write("go.mod", "module github.com/acme/shop\n\ngo 1.21\n");
    project.write("cmd/main.go", "package main\n\nimport \"github.com/acme/shop/handlers\"\n");
    project.write("handlers/users.go", "package handlers\n\nimport (\n\t\"fmt\"\n\t\"github.com/acme/shop/db\"\n)\n");
    project.write("handlers/users_test.go", "package handlers\n\nimport \"github.com/acme/shop/config\"\n");
    project.write("db/db.go", "package db\n\nimport \"github.com/acme/shop/config\"\n");

    const auto links = crossModuleImports(project.root(), "go", Logger::null());
    const std::vector<ModuleLink> expected = {{"cmd", "handlers"}, {"db", "config"}, {"handlers", "db"}};
    EXPECT_EQ(links, expected);
}

TEST(ProjectProfile, CrossModuleImportsForRust)
{
    ProjectFixture project;
    project.write("Cargo.toml", "[dependencies]\naxum = \"0.7\"\n");
    project.write("src/main.rs", "mod routes;\nuse crate::routes::app;\n");
    project.write("src/routes/mod.rs", "use crate::db::pool;\nuse crate::routes::helpers;\n");
    project.write("src/db/mod.rs", "use std::sync::Arc;\n");

    const DependencyProfile profile = profileDependencies(project.root(), Logger::null());
    EXPECT_EQ(profile.language, "rust");
    EXPECT_EQ(profile.framework, "axum");
    const std::vector<ModuleLink> expected = {{"main", "routes"}, {"routes", "db"}};
    EXPECT_EQ(profile.crossModuleImports, expected);
}

TEST(ProjectProfile, EmptyProjectIsUnknown)
{
    ProjectFixture project;
    const DependencyProfile profile = profileDependencies(project.root(), Logger::null());
    EXPECT_EQ(profile.language, "unknown");
    EXPECT_EQ(profile.framework, "unknown");
    EXPECT_TRUE(profile.externalDeps.empty());
    EXPECT_TRUE(profile.importFrequency.empty());
    EXPECT_TRUE(profile.crossModuleImports.empty());

    const StructureProfile structure = profileStructure(project.root(), Logger::null());
    EXPECT_TRUE(structure.rawStructure.empty());
    EXPECT_TRUE(structure.fileCounts.empty());
}
